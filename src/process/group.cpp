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

#include "warden/detail/process/group.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/lexical_cast.hpp>

#include <csignal>
#include <sstream>

using namespace warden::detail::process;

namespace fs = boost::filesystem;

namespace {

struct stat_t {
    char state;
    pid_t group;
};

// Parses the state and the process group out of /proc/<pid>/stat. The command name might contain
// anything, so the fields are located after its closing parenthesis.
bool
read_stat(const fs::path& path, stat_t& stat) {
    fs::ifstream stream(path);
    std::string line;

    if(!std::getline(stream, line)) {
        return false;
    }

    const auto position = line.rfind(')');

    if(position == std::string::npos) {
        return false;
    }

    std::istringstream fields(line.substr(position + 1));
    pid_t parent;

    return static_cast<bool>(fields >> stat.state >> parent >> stat.group);
}

// Returns true when /proc can not tell.
bool
has_live_member(pid_t pgid) {
    boost::system::error_code ec;

    fs::directory_iterator it("/proc", ec), end;

    if(ec) {
        return true;
    }

    for(; it != end; it.increment(ec)) {
        if(ec) {
            return true;
        }

        pid_t pid;

        if(!boost::conversion::try_lexical_convert(it->path().filename().string(), pid)) {
            continue;
        }

        stat_t stat;

        // The process might have vanished in the meantime.
        if(read_stat(it->path() / "stat", stat) && stat.group == pgid && stat.state != 'Z') {
            return true;
        }
    }

    return false;
}

bool
is_live(pid_t pid) {
    const fs::path path = fs::path("/proc") / boost::lexical_cast<std::string>(pid) / "stat";

    stat_t stat;

    if(!read_stat(path, stat)) {
        boost::system::error_code ec;
        return !fs::exists("/proc/self", ec);
    }

    return stat.state != 'Z';
}

} // namespace

process_group_t::process_group_t():
    m_pid(0),
    m_group(false)
{ }

process_group_t::process_group_t(pid_t pid, bool group):
    m_pid(pid),
    m_group(group)
{ }

std::error_code
process_group_t::terminate() const {
    return signal(SIGTERM);
}

std::error_code
process_group_t::kill() const {
    return signal(SIGKILL);
}

std::error_code
process_group_t::signal(int signum) const {
    if(m_pid <= 0) {
        return std::error_code();
    }

    if(::kill(m_group ? -m_pid : m_pid, signum) != 0 && errno != ESRCH) {
        return std::error_code(errno, std::system_category());
    }

    return std::error_code();
}

bool
process_group_t::is_alive() const {
    if(m_pid <= 0) {
        return false;
    }

    // EPERM still means that somebody is there.
    if(::kill(m_group ? -m_pid : m_pid, 0) != 0 && errno != EPERM) {
        return false;
    }

    return m_group ? has_live_member(m_pid) : is_live(m_pid);
}

pid_t
process_group_t::id() const {
    return m_pid;
}

bool
process_group_t::empty() const {
    return m_pid <= 0;
}

bool
process_group_t::group() const {
    return m_group;
}
