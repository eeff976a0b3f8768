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

#ifndef WARDEN_PROCESS_COMPLETION_HPP
#define WARDEN_PROCESS_COMPLETION_HPP

#include "warden/common.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <system_error>

namespace warden { namespace process {

enum class completion_status {
    ready,
    closed,
    timeout,
    canceled
};

// Outcomes of the watched runs of a process, the initial one and every restart. Filled by a single
// producer, closed exactly once after the final delivery. An empty error code is a clean exit.
class completion_t {
    WARDEN_DECLARE_NONCOPYABLE(completion_t)

public:
    typedef std::chrono::steady_clock clock_type;

    explicit
    completion_t(std::size_t capacity);

    // Producer side. Returns false when the queue is full or already closed.

    bool
    deliver(std::error_code outcome);

    // Returns false if the queue has already been closed.
    bool
    close();

    // Consumer side. Outcomes remain readable after close until drained.

    completion_status
    next(std::error_code& outcome);

    completion_status
    next_for(clock_type::duration timeout, std::error_code& outcome);

    completion_status
    next(cancellation_t& cancellation, std::error_code& outcome);

    bool
    closed() const;

    std::size_t
    capacity() const;

    // Total number of outcomes delivered so far, including the consumed ones.
    std::size_t
    delivered() const;

private:
    completion_status
    pop(std::error_code& outcome);

private:
    const std::size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;

    std::deque<std::error_code> m_queue;
    std::size_t m_delivered;
    bool m_closed;
};

}} // namespace warden::process

#endif
