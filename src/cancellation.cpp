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

#include "warden/cancellation.hpp"

#include "warden/executor/asio.hpp"

using namespace warden;

cancellation_t::cancellation_t():
    m_parent_subscription(0),
    m_done(false),
    m_next_id(1)
{ }

cancellation_t::~cancellation_t() {
    if(m_parent) {
        m_parent->unsubscribe(m_parent_subscription);
    }

    if(m_timer) {
        auto timer = std::move(m_timer);

        executor::shared().spawn([timer]() {
            std::error_code ec;
            timer->cancel(ec);
        });
    }
}

auto
cancellation_t::background() -> std::shared_ptr<cancellation_t> {
    return std::shared_ptr<cancellation_t>(new cancellation_t());
}

auto
cancellation_t::with_cancel(const std::shared_ptr<cancellation_t>& parent) -> std::shared_ptr<cancellation_t> {
    BOOST_ASSERT(parent);

    std::shared_ptr<cancellation_t> child(new cancellation_t());
    std::weak_ptr<cancellation_t> weak(child);

    cancellation_t* origin = parent.get();

    child->m_parent = parent;
    child->m_parent_subscription = parent->subscribe([weak, origin]() {
        if(auto target = weak.lock()) {
            // The parent error is assigned before its callbacks are invoked.
            target->cancel(origin->m_error);
        }
    });

    return child;
}

auto
cancellation_t::with_timeout(const std::shared_ptr<cancellation_t>& parent, clock_type::duration timeout)
    -> std::shared_ptr<cancellation_t>
{
    auto child = with_cancel(parent);
    auto timer = std::make_shared<asio::deadline_timer>(executor::shared().loop());

    const auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(timeout);

    timer->expires_from_now(boost::posix_time::microseconds(microseconds.count()));

    // The handler keeps the timer alive until it is invoked.
    std::weak_ptr<cancellation_t> weak(child);

    timer->async_wait([weak, timer](const std::error_code& ec) {
        cancellation_t::on_deadline(weak, ec);
    });

    child->m_timer = std::move(timer);

    return child;
}

void
cancellation_t::cancel() {
    cancel(error::canceled);
}

void
cancellation_t::cancel(std::error_code ec) {
    std::map<subscription_t, callback_type> callbacks;

    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if(m_done) {
        return;
    }

    m_error = ec;
    m_done  = true;

    callbacks.swap(m_callbacks);

    m_condition.notify_all();

    for(auto it = callbacks.begin(); it != callbacks.end(); ++it) {
        it->second();
    }
}

bool
cancellation_t::done() const {
    return m_done;
}

std::error_code
cancellation_t::error() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_error;
}

void
cancellation_t::wait() const {
    std::unique_lock<std::recursive_mutex> lock(m_mutex);

    m_condition.wait(lock, [this]() -> bool {
        return m_done;
    });
}

bool
cancellation_t::wait_for(clock_type::duration timeout) const {
    std::unique_lock<std::recursive_mutex> lock(m_mutex);

    return m_condition.wait_for(lock, timeout, [this]() -> bool {
        return m_done;
    });
}

auto
cancellation_t::subscribe(callback_type callback) -> subscription_t {
    {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);

        if(!m_done) {
            const subscription_t id = m_next_id++;
            m_callbacks.insert(std::make_pair(id, std::move(callback)));
            return id;
        }
    }

    callback();

    return 0;
}

void
cancellation_t::unsubscribe(subscription_t id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_callbacks.erase(id);
}

void
cancellation_t::on_deadline(const std::weak_ptr<cancellation_t>& weak, const std::error_code& ec) {
    if(ec == asio::error::operation_aborted) {
        return;
    }

    if(auto target = weak.lock()) {
        target->cancel(error::deadline_exceeded);
    }
}
