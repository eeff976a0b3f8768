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

#ifndef WARDEN_DEFAULTS_HPP
#define WARDEN_DEFAULTS_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace warden {

struct defaults {
    // Script staging.
    static const std::string shell;
    static const std::string script_pattern;
    static const std::string script_header;

    // Exclusive runner.
    static const std::string runner_directory;
    static const std::string runner_pattern;

    // Lifecycle timings.
    static const std::chrono::milliseconds restart_interval;
    static const std::chrono::milliseconds termination_grace;

    // Output scanning.
    static const std::size_t scan_buffer_size;
    static const std::size_t scan_max_line_size;

    // Logging.
    static const std::string log_verbosity;
};

} // namespace warden

#endif
