/*
    Copyright (c) 2011-2014 Andrey Sibiryov <me@kobology.ru>
    Copyright (c) 2011-2014 Other contributors as noted in the AUTHORS file.

    This file is part of Warden.

    Warden is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Warden is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef WARDEN_LOGGING_SETUP_HPP
#define WARDEN_LOGGING_SETUP_HPP

#include "warden/logging.hpp"

#include <blackhole/root.hpp>

namespace warden { namespace logging {

// Maps "debug", "info", "warning" and "error" to the corresponding priority. Throws error_t on
// anything else.
auto
parse_verbosity(const std::string& verbosity) -> priorities;

// Root logger printing records of at least the given priority to the standard error.
auto
make_console_logger(priorities verbosity) -> std::unique_ptr<blackhole::root_logger_t>;

// Root logger without handlers.
auto
make_null_logger() -> std::unique_ptr<blackhole::root_logger_t>;

}} // namespace warden::logging

#endif
