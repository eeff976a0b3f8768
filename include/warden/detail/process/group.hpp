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

#ifndef WARDEN_DETAIL_PROCESS_GROUP_HPP
#define WARDEN_DETAIL_PROCESS_GROUP_HPP

#include "warden/common.hpp"

#include <system_error>

#include <sys/types.h>

namespace warden { namespace detail { namespace process {

// Signalling target of a launched child: either the whole process group led by the child, or the
// direct child alone for detached processes. A vanished target is not an error.
class process_group_t {
public:
    process_group_t();
    process_group_t(pid_t pid, bool group);

    // Sends SIGTERM.
    std::error_code
    terminate() const;

    // Sends SIGKILL.
    std::error_code
    kill() const;

    std::error_code
    signal(int signum) const;

    // Zombies awaiting their reaper do not count.
    bool
    is_alive() const;

    pid_t
    id() const;

    bool
    empty() const;

    bool
    group() const;

private:
    pid_t m_pid;
    bool m_group;
};

}}} // namespace warden::detail::process

#endif
