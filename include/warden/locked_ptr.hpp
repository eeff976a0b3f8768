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

#ifndef WARDEN_LOCKED_PTR_HPP
#define WARDEN_LOCKED_PTR_HPP

#include <mutex>
#include <utility>

namespace warden {

// Access to a value which keeps its owner's mutex locked until destroyed. Instantiated with a const
// type for read-only access.
template<class T, class Lockable = std::mutex>
class locked_ptr {
public:
    locked_ptr(T& target, Lockable& mutex):
        m_target(&target),
        m_lock(mutex)
    { }

    locked_ptr(locked_ptr&& other):
        m_target(other.m_target),
        m_lock(std::move(other.m_lock))
    { }

    T*
    operator->() const {
        return m_target;
    }

    T&
    operator*() const {
        return *m_target;
    }

private:
    T* m_target;
    std::unique_lock<Lockable> m_lock;
};

// Value paired with the mutex guarding it. The value is only reachable through synchronize().
template<class T, class Lockable = std::mutex>
class synchronized {
public:
    template<class... Args>
    explicit
    synchronized(Args&&... args):
        m_value(std::forward<Args>(args)...)
    { }

    locked_ptr<T, Lockable>
    synchronize() {
        return locked_ptr<T, Lockable>(m_value, m_mutex);
    }

    locked_ptr<const T, Lockable>
    synchronize() const {
        return locked_ptr<const T, Lockable>(m_value, m_mutex);
    }

    locked_ptr<T, Lockable>
    operator->() {
        return synchronize();
    }

    locked_ptr<const T, Lockable>
    operator->() const {
        return synchronize();
    }

private:
    T m_value;
    mutable Lockable m_mutex;
};

} // namespace warden

#endif
