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

#ifndef WARDEN_API_HANDLE_HPP
#define WARDEN_API_HANDLE_HPP

#include "warden/common.hpp"

#include <system_error>

#include <sys/types.h>

namespace warden { namespace api {

// Readable end of a child output stream.
struct stream_t {
    virtual
   ~stream_t() {
        // Empty.
    }

    // Blocks until some data is available. Returns zero at the end of the stream. Throws
    // std::system_error, with error::stream_closed once the stream has been shut down locally.
    virtual
    std::size_t
    read(char* buffer, std::size_t size) = 0;

    // Makes pending and future reads fail with error::stream_closed. Idempotent.
    virtual
    void
    shutdown() = 0;
};

// A single managed process, as seen by the output reader and the exclusive runner.
struct handle_t {
    virtual
   ~handle_t() {
        // Empty.
    }

    virtual
    void
    start(const std::shared_ptr<cancellation_t>& cancellation) = 0;

    virtual
    bool
    started() const = 0;

    virtual
    void
    close() = 0;

    virtual
    bool
    closed() const = 0;

    // Outcomes of the watched runs.
    virtual
    process::completion_t&
    wait() = 0;

    // Zero until started.
    virtual
    pid_t
    pid() const = 0;

    // Zero until a failed run is observed. Then the exit status of the latest failed run, or -1 when
    // it was killed by a signal.
    virtual
    int
    exit_code() const = 0;

    // Streams of the current run, null until started. When the output goes to a file, both return the
    // same stream reading that file from the beginning.
    virtual
    std::shared_ptr<stream_t>
    stdout_stream() const = 0;

    virtual
    std::shared_ptr<stream_t>
    stderr_stream() const = 0;
};

}} // namespace warden::api

#endif
