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

#include "signal.hpp"

#include "warden/errors.hpp"
#include "warden/logging.hpp"

#include <future>

#include <csignal>

namespace ph = std::placeholders;

using namespace warden;
using namespace warden::runtime;

signal_watcher_t::signal_watcher_t(asio::io_service& loop, const std::set<int>& signals,
                                   std::shared_ptr<cancellation_t> cancellation,
                                   std::shared_ptr<logging::logger_t> log):
    m_loop(loop),
    m_signals(loop),
    m_cancellation(std::move(cancellation)),
    m_log(std::move(log)),
    m_caught(0)
{
    for(int sig: signals) {
        if(sig == SIGSEGV || sig == SIGFPE || sig == SIGILL || sig == SIGBUS) {
            throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                "can not handle trap signal in sighandler");
        }

        m_signals.add(sig);
    }

    m_signals.async_wait(std::bind(&signal_watcher_t::on_signal, this, ph::_1, ph::_2));
}

signal_watcher_t::~signal_watcher_t() {
    std::promise<void> promise;

    m_loop.post([&]() {
        std::error_code ec;
        m_signals.cancel(ec);

        // Runs after the aborted handler.
        m_loop.post([&]() {
            promise.set_value();
        });
    });

    promise.get_future().wait();
}

int
signal_watcher_t::caught() const {
    return m_caught;
}

void
signal_watcher_t::on_signal(const std::error_code& ec, int signum) {
    if(ec == asio::error::operation_aborted) {
        return;
    }

    if(ec) {
        WARDEN_LOG_ERROR(m_log, "unable to wait for signals - [{}] {}", ec.value(), ec.message());
        return;
    }

    WARDEN_LOG_INFO(m_log, "caught signal {} - {}, cancelling", signum,
        error::make_signal_error(signum).message());

    m_caught = signum;
    m_cancellation->cancel();

    m_signals.async_wait(std::bind(&signal_watcher_t::on_signal, this, ph::_1, ph::_2));
}
