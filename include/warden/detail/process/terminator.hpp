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

#ifndef WARDEN_DETAIL_PROCESS_TERMINATOR_HPP
#define WARDEN_DETAIL_PROCESS_TERMINATOR_HPP

#include "warden/common.hpp"
#include "warden/detail/process/group.hpp"

#include <chrono>
#include <future>

#include <asio/deadline_timer.hpp>
#include <asio/io_service.hpp>

namespace warden { namespace detail { namespace process {

// Two-phase stop of a process group: SIGTERM first, then SIGKILL if the target is still alive once
// the grace window expires. The target is checked on every tick of the timer.
class terminator_t:
    public std::enable_shared_from_this<terminator_t>
{
public:
    terminator_t(asio::io_service& loop, process_group_t target, std::chrono::milliseconds grace,
                 ::warden::logging::logger_t& log);

    // The future is ready once the target has vanished or has been killed. Must not be waited for
    // from within the loop.
    std::future<void>
    start();

private:
    void
    on_tick(const std::error_code& ec);

    void
    schedule();

    void
    finish();

private:
    const process_group_t m_target;
    const std::chrono::milliseconds m_grace;

    ::warden::logging::logger_t& m_log;

    asio::deadline_timer m_timer;
    std::chrono::steady_clock::time_point m_deadline;

    std::promise<void> m_done;
};

}}} // namespace warden::detail::process

#endif
