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

#ifndef WARDEN_EXECUTOR_ASIO_HPP
#define WARDEN_EXECUTOR_ASIO_HPP

#include "warden/common.hpp"

#include <functional>
#include <thread>

#include <asio/io_service.hpp>

#include <boost/optional/optional.hpp>

namespace warden { namespace executor {

// Runs an asio::io_service in a spawned thread. Timers, pipe streams and signal sets are served by
// it. SIGPIPE is blocked in that thread, so writing into an abandoned pipe fails with EPIPE.
class owning_asio_t {
    WARDEN_DECLARE_NONCOPYABLE(owning_asio_t)

public:
    owning_asio_t();

    // Waits for the pending operations to complete.
   ~owning_asio_t();

    auto
    spawn(std::function<void()> work) -> void;

    auto
    loop() -> asio::io_service&;

private:
    auto
    run() -> void;

private:
    asio::io_service io_loop;
    boost::optional<asio::io_service::work> work;
    std::thread thread;
};

// Process-wide executor, started on first use and never destroyed.
auto
shared() -> owning_asio_t&;

}} // namespace warden::executor

#endif
