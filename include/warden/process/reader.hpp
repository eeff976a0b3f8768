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

#ifndef WARDEN_PROCESS_READER_HPP
#define WARDEN_PROCESS_READER_HPP

#include "warden/api/handle.hpp"

#include <functional>
#include <system_error>

namespace warden { namespace process {

struct read_options_t {
    typedef std::function<void(const std::string&)> line_callback_type;

    bool read_stdout;
    bool read_stderr;

    // Invoked for every line, without the line terminator.
    line_callback_type on_line;

    // Lines longer than max(initial_buffer_size, defaults::scan_max_line_size) are rejected.
    std::size_t initial_buffer_size;

    // Whether to wait for the next outcome of the process once the streams are exhausted.
    bool wait_for_completion;

    read_options_t();
};

// Scans the selected output streams of a started process line by line, standard output first. The
// scan stops early when the context is cancelled or the process is closed.
//
// Returns an empty error code on success, or one of error::not_started, error::aborted,
// error::no_stream_selected, error::line_too_long, the cancellation error, a stream error, or the
// outcome of the process when waiting for completion.
auto
read(const std::shared_ptr<cancellation_t>& cancellation, api::handle_t& handle,
     const read_options_t& options) -> std::error_code;

}} // namespace warden::process

#endif
