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

#ifndef WARDEN_DETAIL_PROCESS_STREAM_HPP
#define WARDEN_DETAIL_PROCESS_STREAM_HPP

#include "warden/api/handle.hpp"
#include "warden/forwards.hpp"

#include <atomic>
#include <future>

#include <asio/io_service.hpp>
#include <asio/posix/stream_descriptor.hpp>

namespace warden { namespace detail { namespace process {

// Read end of a child output pipe, served by the given loop. Reads block the calling thread until
// the loop completes them, so they must never be issued from within the loop itself.
//
// Must be created with std::make_shared.
class pipe_stream_t:
    public api::stream_t,
    public std::enable_shared_from_this<pipe_stream_t>
{
    WARDEN_DECLARE_NONCOPYABLE(pipe_stream_t)

public:
    // Takes ownership of the descriptor.
    pipe_stream_t(asio::io_service& loop, int fd);

    virtual
    std::size_t
    read(char* buffer, std::size_t size);

    // Aborts the pending read, if any. Every read after that fails with error::stream_closed.
    virtual
    void
    shutdown();

private:
    asio::io_service& m_loop;
    asio::posix::stream_descriptor m_pipe;

    // Only touched from within the loop.
    bool m_closed;
};

// Writes the script body into the child standard input and closes it afterwards. A child that
// exits without reading everything is not an error.
//
// Must be created with std::make_shared.
class feeder_t:
    public std::enable_shared_from_this<feeder_t>
{
    WARDEN_DECLARE_NONCOPYABLE(feeder_t)

public:
    // Takes ownership of the descriptor.
    feeder_t(asio::io_service& loop, int fd, const std::string& data, ::warden::logging::logger_t& log);

    void
    start();

    // Aborts the write unless it has already completed, then waits for the descriptor to be closed.
    void
    stop();

private:
    void
    on_write(const std::error_code& ec, std::size_t length);

private:
    asio::io_service& m_loop;
    asio::posix::stream_descriptor m_pipe;

    const std::string m_data;

    ::warden::logging::logger_t& m_log;

    std::promise<void> m_promise;
    std::shared_future<void> m_done;
};

// Caller-owned output file, read from the beginning.
class file_stream_t:
    public api::stream_t
{
    WARDEN_DECLARE_NONCOPYABLE(file_stream_t)

public:
    explicit
    file_stream_t(const std::string& path);

    virtual
   ~file_stream_t();

    virtual
    std::size_t
    read(char* buffer, std::size_t size);

    virtual
    void
    shutdown();

private:
    const int m_fd;

    std::atomic<bool> m_shutdown;
};

}}} // namespace warden::detail::process

#endif
