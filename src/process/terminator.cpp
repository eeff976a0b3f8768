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

#include "warden/detail/process/terminator.hpp"

#include "warden/logging.hpp"

namespace ph = std::placeholders;

using namespace warden;
using namespace warden::detail::process;

namespace {

const boost::posix_time::milliseconds kTick(50);

} // namespace

terminator_t::terminator_t(asio::io_service& loop, process_group_t target,
                           std::chrono::milliseconds grace, ::warden::logging::logger_t& log):
    m_target(target),
    m_grace(grace),
    m_log(log),
    m_timer(loop)
{ }

std::future<void>
terminator_t::start() {
    auto future = m_done.get_future();

    if(!m_target.is_alive()) {
        WARDEN_LOG_DEBUG(m_log, "process {} has already finished", m_target.id());
        finish();
        return future;
    }

    if(auto ec = m_target.terminate()) {
        WARDEN_LOG_WARNING(m_log, "unable to send SIGTERM to {} - [{}] {}", m_target.id(),
            ec.value(), ec.message());
    }

    m_deadline = std::chrono::steady_clock::now() + m_grace;

    schedule();

    return future;
}

void
terminator_t::schedule() {
    m_timer.expires_from_now(kTick);
    m_timer.async_wait(std::bind(&terminator_t::on_tick, shared_from_this(), ph::_1));
}

void
terminator_t::on_tick(const std::error_code& ec) {
    if(ec == asio::error::operation_aborted) {
        WARDEN_LOG_DEBUG(m_log, "termination timer of process {} has been cancelled", m_target.id());
        finish();
        return;
    }

    if(!m_target.is_alive()) {
        WARDEN_LOG_DEBUG(m_log, "process {} has been terminated", m_target.id());
        finish();
        return;
    }

    if(std::chrono::steady_clock::now() < m_deadline) {
        schedule();
        return;
    }

    WARDEN_LOG_DEBUG(m_log, "process {} is still alive after {} ms, sending SIGKILL", m_target.id(),
        m_grace.count());

    if(auto ec = m_target.kill()) {
        WARDEN_LOG_WARNING(m_log, "unable to send SIGKILL to {} - [{}] {}", m_target.id(),
            ec.value(), ec.message());
    }

    finish();
}

void
terminator_t::finish() {
    m_done.set_value();
}
