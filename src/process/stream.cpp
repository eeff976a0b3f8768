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

#include "warden/detail/process/stream.hpp"

#include "warden/format.hpp"
#include "warden/logging.hpp"

#include <asio/buffer.hpp>
#include <asio/write.hpp>

#include <fcntl.h>
#include <unistd.h>

namespace ph = std::placeholders;

using namespace warden;
using namespace warden::detail::process;

namespace {

[[noreturn]]
void
throw_closed() {
    throw std::system_error(error::stream_closed);
}

} // namespace

pipe_stream_t::pipe_stream_t(asio::io_service& loop, int fd):
    m_loop(loop),
    m_pipe(loop, fd),
    m_closed(false)
{ }

std::size_t
pipe_stream_t::read(char* buffer, std::size_t size) {
    auto promise = std::make_shared<std::promise<std::size_t>>();
    auto future  = promise->get_future();

    auto self = shared_from_this();

    m_loop.post([self, promise, buffer, size]() {
        if(self->m_closed) {
            promise->set_exception(std::make_exception_ptr(std::system_error(error::stream_closed)));
            return;
        }

        self->m_pipe.async_read_some(asio::buffer(buffer, size),
            [self, promise](const std::error_code& ec, std::size_t length)
        {
            if(ec == asio::error::eof) {
                promise->set_value(0);
            } else if(ec == asio::error::operation_aborted) {
                promise->set_exception(std::make_exception_ptr(std::system_error(error::stream_closed)));
            } else if(ec) {
                promise->set_exception(std::make_exception_ptr(
                    std::system_error(ec, "unable to read the output pipe")));
            } else {
                promise->set_value(length);
            }
        });
    });

    return future.get();
}

void
pipe_stream_t::shutdown() {
    auto self = shared_from_this();

    m_loop.post([self]() {
        self->m_closed = true;

        std::error_code ec;
        self->m_pipe.cancel(ec);
    });
}

feeder_t::feeder_t(asio::io_service& loop, int fd, const std::string& data,
                   ::warden::logging::logger_t& log):
    m_loop(loop),
    m_pipe(loop, fd),
    m_data(data),
    m_log(log),
    m_done(m_promise.get_future().share())
{ }

void
feeder_t::start() {
    auto self = shared_from_this();

    m_loop.post([self]() {
        asio::async_write(self->m_pipe, asio::buffer(self->m_data),
            std::bind(&feeder_t::on_write, self, ph::_1, ph::_2));
    });
}

void
feeder_t::stop() {
    auto self = shared_from_this();

    m_loop.post([self]() {
        std::error_code ec;
        self->m_pipe.cancel(ec);
    });

    m_done.wait();
}

void
feeder_t::on_write(const std::error_code& ec, std::size_t length) {
    if(ec && ec != asio::error::broken_pipe && ec != asio::error::operation_aborted) {
        WARDEN_LOG_WARNING(m_log, "unable to feed the script after {} bytes - [{}] {}", length,
            ec.value(), ec.message());
    }

    std::error_code rv;
    m_pipe.close(rv);

    m_promise.set_value();
}

file_stream_t::file_stream_t(const std::string& path):
    m_fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)),
    m_shutdown(false)
{
    if(m_fd < 0) {
        throw std::system_error(errno, std::system_category(),
            warden::format("unable to open output file '{}'", path));
    }
}

file_stream_t::~file_stream_t() {
    ::close(m_fd);
}

std::size_t
file_stream_t::read(char* buffer, std::size_t size) {
    while(true) {
        if(m_shutdown) {
            throw_closed();
        }

        const ssize_t length = ::read(m_fd, buffer, size);

        if(length < 0) {
            if(errno == EINTR) {
                continue;
            }

            throw std::system_error(errno, std::system_category(), "unable to read the output file");
        }

        return static_cast<std::size_t>(length);
    }
}

void
file_stream_t::shutdown() {
    m_shutdown = true;
}
