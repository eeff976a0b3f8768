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

#include "warden/process/reader.hpp"

#include "warden/cancellation.hpp"
#include "warden/defaults.hpp"

#include "warden/process/completion.hpp"

#include <algorithm>

using namespace warden;
using namespace warden::process;

namespace {

class scanner_t {
public:
    scanner_t(const std::shared_ptr<cancellation_t>& cancellation, api::handle_t& handle,
              const read_options_t& options):
        m_cancellation(cancellation),
        m_handle(handle),
        m_options(options),
        m_limit(std::max(options.initial_buffer_size, defaults::scan_max_line_size)),
        m_chunk(std::max<std::size_t>(options.initial_buffer_size, 1))
    { }

    std::error_code
    scan(api::stream_t& stream) {
        std::string pending;

        while(true) {
            std::size_t length = 0;

            try {
                length = stream.read(m_chunk.data(), m_chunk.size());
            } catch(const std::system_error& e) {
                // The stream has been torn down by closing the process.
                if(e.code() == error::stream_closed) {
                    return std::error_code();
                }

                return e.code();
            }

            if(length == 0) {
                break;
            }

            pending.append(m_chunk.data(), length);

            std::size_t begin = 0;
            std::size_t end = 0;

            while((end = pending.find('\n', begin)) != std::string::npos) {
                if(end - begin > m_limit) {
                    return error::line_too_long;
                }

                if(auto ec = emit(pending.substr(begin, end - begin))) {
                    return ec;
                }

                begin = end + 1;
            }

            pending.erase(0, begin);

            if(pending.size() > m_limit) {
                return error::line_too_long;
            }
        }

        if(!pending.empty()) {
            return emit(pending);
        }

        return std::error_code();
    }

private:
    std::error_code
    emit(std::string line) {
        if(!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if(m_options.on_line) {
            m_options.on_line(line);
        }

        if(m_cancellation->done()) {
            return m_cancellation->error();
        }

        if(m_handle.closed()) {
            return error::aborted;
        }

        return std::error_code();
    }

private:
    const std::shared_ptr<cancellation_t>& m_cancellation;
    api::handle_t& m_handle;
    const read_options_t& m_options;

    const std::size_t m_limit;
    std::vector<char> m_chunk;
};

} // namespace

read_options_t::read_options_t():
    read_stdout(false),
    read_stderr(false),
    initial_buffer_size(defaults::scan_buffer_size),
    wait_for_completion(false)
{ }

auto
process::read(const std::shared_ptr<cancellation_t>& cancellation, api::handle_t& handle,
              const read_options_t& options) -> std::error_code
{
    if(!handle.started()) {
        return error::not_started;
    }

    if(handle.closed()) {
        return error::aborted;
    }

    if(!options.read_stdout && !options.read_stderr) {
        return error::no_stream_selected;
    }

    scanner_t scanner(cancellation, handle, options);

    std::vector<std::shared_ptr<api::stream_t>> streams;

    if(options.read_stdout) {
        streams.push_back(handle.stdout_stream());
    }

    if(options.read_stderr) {
        streams.push_back(handle.stderr_stream());
    }

    for(auto it = streams.begin(); it != streams.end(); ++it) {
        if(!*it) {
            continue;
        }

        if(auto ec = scanner.scan(**it)) {
            return ec;
        }
    }

    if(!options.wait_for_completion) {
        return std::error_code();
    }

    std::error_code outcome;

    switch(handle.wait().next(*cancellation, outcome)) {
    case completion_status::ready:
        return outcome;
    case completion_status::canceled:
        return cancellation->error();
    default:
        return std::error_code();
    }
}
