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

#ifndef WARDEN_PROCESS_STAGING_HPP
#define WARDEN_PROCESS_STAGING_HPP

#include "warden/common.hpp"

#include <boost/filesystem/path.hpp>

namespace warden { namespace process {

// Creates a new empty file in the directory, with a name produced from the glob pattern by replacing
// its last '*' with a random token, or by appending one. The file is created exclusively with mode
// 0600. Throws std::system_error.
auto
create_staged_file(const boost::filesystem::path& directory, const std::string& pattern)
    -> boost::filesystem::path;

// Best-effort sweep of the regular files in the directory whose names match the glob pattern.
// Failures are logged and skipped. Returns the number of removed files.
auto
remove_staged_files(const boost::filesystem::path& directory, const std::string& pattern)
    -> std::size_t;

auto
remove_staged_files(const boost::filesystem::path& directory, const std::string& pattern,
                    logging::logger_t& log) -> std::size_t;

}} // namespace warden::process

#endif
