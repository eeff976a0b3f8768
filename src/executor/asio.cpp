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

#include "warden/executor/asio.hpp"

#include <csignal>

#include <pthread.h>

using namespace warden::executor;

owning_asio_t::owning_asio_t():
    io_loop(),
    work(asio::io_service::work(io_loop)),
    thread(&owning_asio_t::run, this)
{ }

owning_asio_t::~owning_asio_t() {
    work.reset();
    thread.join();
}

auto
owning_asio_t::spawn(std::function<void()> work) -> void {
    io_loop.post(std::move(work));
}

auto
owning_asio_t::loop() -> asio::io_service& {
    return io_loop;
}

auto
owning_asio_t::run() -> void {
    sigset_t sigset;

    ::sigemptyset(&sigset);
    ::sigaddset(&sigset, SIGPIPE);
    ::pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

    io_loop.run();
}

auto
warden::executor::shared() -> owning_asio_t& {
    static owning_asio_t* instance = new owning_asio_t();
    return *instance;
}
