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

#ifndef WARDEN_DETAIL_PROCESS_LAUNCHER_HPP
#define WARDEN_DETAIL_PROCESS_LAUNCHER_HPP

#include "warden/common.hpp"

#include <boost/optional/optional.hpp>

#include <sys/types.h>

namespace warden { namespace detail { namespace process {

struct launch_options_t {
    // The first element is either a path or a name looked up in PATH.
    std::vector<std::string> argv;

    // Complete environment of the child, as KEY=VALUE strings.
    std::vector<std::string> environment;

    // Whether the child should lead a new process group.
    bool group;

    // Whether to connect the standard input to a pipe, otherwise it is connected to /dev/null.
    bool input;

    // Whether the standard error should share the standard output pipe.
    bool combine;

    // Appends both output streams to this file instead of pipes.
    boost::optional<std::string> output_file;

    launch_options_t():
        group(true),
        input(false),
        combine(false)
    { }
};

// Descriptors are owned by the caller and are -1 when not applicable.
struct launched_t {
    pid_t pid;

    int input;
    int output;
    int error;
};

// Forks and executes the child. Throws std::system_error if any of the steps fails, including the
// exec itself, in which case the child has already been collected.
auto
launch(const launch_options_t& options) -> launched_t;

// Looks the name up in the PATH entries, unless it contains a slash.
auto
resolve(const std::string& name, const std::string& path) -> boost::optional<std::string>;

auto
resolve(const std::string& name) -> boost::optional<std::string>;

// Inherited environment of the process with the overrides merged over it.
auto
merge_environment(const std::vector<std::string>& overrides) -> std::vector<std::string>;

}}} // namespace warden::detail::process

#endif
