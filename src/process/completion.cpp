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

#include "warden/process/completion.hpp"

#include "warden/cancellation.hpp"

using namespace warden;
using namespace warden::process;

completion_t::completion_t(std::size_t capacity):
    m_capacity(capacity == 0 ? 1 : capacity),
    m_delivered(0),
    m_closed(false)
{ }

bool
completion_t::deliver(std::error_code outcome) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if(m_closed || m_queue.size() >= m_capacity) {
            return false;
        }

        m_queue.push_back(outcome);
        m_delivered++;
    }

    m_condition.notify_all();

    return true;
}

bool
completion_t::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if(m_closed) {
            return false;
        }

        m_closed = true;
    }

    m_condition.notify_all();

    return true;
}

completion_status
completion_t::pop(std::error_code& outcome) {
    if(!m_queue.empty()) {
        outcome = m_queue.front();
        m_queue.pop_front();
        return completion_status::ready;
    }

    return completion_status::closed;
}

completion_status
completion_t::next(std::error_code& outcome) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_condition.wait(lock, [this]() -> bool {
        return !m_queue.empty() || m_closed;
    });

    return pop(outcome);
}

completion_status
completion_t::next_for(clock_type::duration timeout, std::error_code& outcome) {
    std::unique_lock<std::mutex> lock(m_mutex);

    const bool ready = m_condition.wait_for(lock, timeout, [this]() -> bool {
        return !m_queue.empty() || m_closed;
    });

    if(!ready) {
        return completion_status::timeout;
    }

    return pop(outcome);
}

completion_status
completion_t::next(cancellation_t& cancellation, std::error_code& outcome) {
    const auto id = cancellation.subscribe([this]() {
        // Taking the lock here orders the notification after the waiter has started waiting.
        std::lock_guard<std::mutex> lock(m_mutex);
        m_condition.notify_all();
    });

    completion_status status;

    {
        std::unique_lock<std::mutex> lock(m_mutex);

        m_condition.wait(lock, [&]() -> bool {
            return !m_queue.empty() || m_closed || cancellation.done();
        });

        if(m_queue.empty() && !m_closed) {
            status = completion_status::canceled;
        } else {
            status = pop(outcome);
        }
    }

    cancellation.unsubscribe(id);

    return status;
}

bool
completion_t::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t
completion_t::capacity() const {
    return m_capacity;
}

std::size_t
completion_t::delivered() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_delivered;
}
