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

#ifndef WARDEN_PROCESS_RUNNER_HPP
#define WARDEN_PROCESS_RUNNER_HPP

#include "warden/common.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <system_error>

#include <boost/filesystem/path.hpp>
#include <boost/optional/optional.hpp>

namespace warden { namespace process {

struct run_result_t {
    // Captured standard output and standard error. Empty if the run did not finish or the capture
    // could not be read back.
    boost::optional<std::string> output;

    // Exit code of the process, see api::handle_t::exit_code().
    int exit_code;

    // Empty on success. Otherwise the outcome of the process, the cancellation error or the error
    // reading the capture back.
    std::error_code error;

    run_result_t():
        exit_code(0)
    { }
};

// Runs one script at a time to completion, in the file-backed script mode with the output captured
// in a temporary file. A run never waits for another one to finish.
class runner_t {
    WARDEN_DECLARE_NONCOPYABLE(runner_t)

public:
    typedef std::function<void(builder_t&)> configure_type;

    // Defaults to a subdirectory of the system temporary directory and the default grace window.
    runner_t();

    runner_t(boost::filesystem::path directory, std::chrono::milliseconds grace,
             std::shared_ptr<logging::logger_t> log = nullptr);

    // Blocks until the script finishes or the context is cancelled. The builder is prepared with
    // the script, the capture file and the grace window before being handed to the configure
    // callback. Throws error_t with error::already_running if another run is in flight, and
    // std::system_error if the run could not be set up.
    run_result_t
    run(const std::shared_ptr<cancellation_t>& cancellation, const std::string& script,
        const configure_type& configure = configure_type());

    bool
    running() const;

    const boost::filesystem::path&
    directory() const;

private:
    const boost::filesystem::path m_directory;
    const std::chrono::milliseconds m_grace;

    std::shared_ptr<logging::logger_t> m_log;

    std::atomic<bool> m_running;
};

}} // namespace warden::process

#endif
