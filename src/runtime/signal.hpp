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

#pragma once

#include "warden/cancellation.hpp"

#include <atomic>
#include <set>

#include <asio/io_service.hpp>
#include <asio/signal_set.hpp>

namespace warden { namespace runtime {

// Cancels the token when one of the signals arrives. The signals are waited for on the given loop,
// which must outlive the watcher.
class signal_watcher_t {
    WARDEN_DECLARE_NONCOPYABLE(signal_watcher_t)

public:
    signal_watcher_t(asio::io_service& loop, const std::set<int>& signals,
                     std::shared_ptr<cancellation_t> cancellation,
                     std::shared_ptr<logging::logger_t> log);

    // Waits for the pending handler to be aborted.
   ~signal_watcher_t();

    // Number of the last caught signal, zero if none.
    int
    caught() const;

private:
    void
    on_signal(const std::error_code& ec, int signum);

private:
    asio::io_service& m_loop;
    asio::signal_set m_signals;

    const std::shared_ptr<cancellation_t> m_cancellation;
    const std::shared_ptr<logging::logger_t> m_log;

    std::atomic<int> m_caught;
};

}} // namespace warden::runtime
