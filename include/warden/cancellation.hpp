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

#ifndef WARDEN_CANCELLATION_HPP
#define WARDEN_CANCELLATION_HPP

#include "warden/common.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <system_error>

#include <asio/deadline_timer.hpp>

namespace warden {

// Caller's context. Cancellation propagates from parents to children, never the other way around.
//
// Subscribed callbacks are invoked exactly once, on the thread which cancels the token, while the
// token is locked. They must not subscribe to or unsubscribe from the same token.
class cancellation_t:
    public std::enable_shared_from_this<cancellation_t>
{
    WARDEN_DECLARE_NONCOPYABLE(cancellation_t)

public:
    typedef std::chrono::steady_clock clock_type;
    typedef std::function<void()> callback_type;
    typedef std::uint64_t subscription_t;

    // Never cancelled on its own.
    static
    auto
    background() -> std::shared_ptr<cancellation_t>;

    static
    auto
    with_cancel(const std::shared_ptr<cancellation_t>& parent) -> std::shared_ptr<cancellation_t>;

    static
    auto
    with_timeout(const std::shared_ptr<cancellation_t>& parent, clock_type::duration timeout)
        -> std::shared_ptr<cancellation_t>;

   ~cancellation_t();

    // Cancels with error::canceled. Does nothing when already cancelled.
    void
    cancel();

    bool
    done() const;

    // Empty until cancelled, then either error::canceled or error::deadline_exceeded.
    std::error_code
    error() const;

    void
    wait() const;

    // Returns true if the token has been cancelled before the timeout expired.
    bool
    wait_for(clock_type::duration timeout) const;

    subscription_t
    subscribe(callback_type callback);

    void
    unsubscribe(subscription_t id);

private:
    cancellation_t();

    void
    cancel(std::error_code ec);

    static
    void
    on_deadline(const std::weak_ptr<cancellation_t>& weak, const std::error_code& ec);

private:
    std::shared_ptr<cancellation_t> m_parent;
    subscription_t m_parent_subscription;

    // Recursive, because the last owner of a child token might be released from within a callback.
    mutable std::recursive_mutex m_mutex;
    mutable std::condition_variable_any m_condition;

    std::atomic<bool> m_done;
    std::error_code m_error;

    subscription_t m_next_id;
    std::map<subscription_t, callback_type> m_callbacks;

    // Deadline of the timeout contexts, served by the shared executor.
    std::shared_ptr<asio::deadline_timer> m_timer;
};

} // namespace warden

#endif
