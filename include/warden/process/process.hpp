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

#ifndef WARDEN_PROCESS_PROCESS_HPP
#define WARDEN_PROCESS_PROCESS_HPP

#include "warden/api/handle.hpp"
#include "warden/cancellation.hpp"
#include "warden/locked_ptr.hpp"

#include "warden/detail/process/group.hpp"
#include "warden/detail/process/stream.hpp"

#include "warden/process/completion.hpp"
#include "warden/process/spec.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace warden { namespace process {

struct combined_output_t {
    // Standard output and standard error, interleaved as written.
    std::string output;

    // Empty on a clean exit.
    std::error_code error;
};

// Owns a single OS process through its lifecycle: not started, started, then closed. Restarts it on
// failure according to the restart policy and reports the outcome of every run through wait().
//
// All the methods are thread-safe. The destructor closes the process and joins the watcher.
class process_t:
    public api::handle_t
{
    WARDEN_DECLARE_NONCOPYABLE(process_t)

public:
    // Stages the script in the file-backed mode. Throws std::system_error.
    explicit
    process_t(spec_t spec);

    virtual
   ~process_t();

    // Launches the process and starts watching it. Does nothing if already started or closed.
    // Cancelling the context kills the process. Throws std::system_error if the launch fails.
    virtual
    void
    start(const std::shared_ptr<cancellation_t>& cancellation);

    virtual
    bool
    started() const;

    // Stops the restarts, terminates the process, waiting for up to the grace window before
    // killing it, shuts the streams down and removes the staged script. Does nothing if not started
    // or already closed.
    virtual
    void
    close();

    virtual
    bool
    closed() const;

    // Same as close(), except that nothing is signalled once the current run has been collected.
    // Whatever the run has left running in the background keeps running.
    void
    release();

    virtual
    completion_t&
    wait();

    virtual
    pid_t
    pid() const;

    virtual
    int
    exit_code() const;

    virtual
    std::shared_ptr<api::stream_t>
    stdout_stream() const;

    virtual
    std::shared_ptr<api::stream_t>
    stderr_stream() const;

    // Runs the process once and blocks until it exits, collecting both output streams. Throws
    // error_t with error::already_started if the process has already been started.
    combined_output_t
    start_and_wait(const std::shared_ptr<cancellation_t>& cancellation);

    unsigned int
    restarts() const;

    const spec_t&
    spec() const;

    // Empty unless in the file-backed script mode and not yet closed.
    boost::optional<boost::filesystem::path>
    staged_script() const;

private:
    struct streams_t {
        std::shared_ptr<api::stream_t> out;
        std::shared_ptr<api::stream_t> err;
    };

    // Must be called with the command lock held.
    void
    spawn(bool combine);

    void
    watch();

    void
    stop_feeder();

    // Must be called with the command lock held.
    void
    finish(bool terminate);

    std::error_code
    collect(pid_t pid);

    void
    record(const std::error_code& outcome);

    void
    on_cancel();

    void
    remove_staged_script();

private:
    const spec_t m_spec;

    std::shared_ptr<logging::logger_t> m_root;
    std::unique_ptr<logging::logger_t> m_log;

    std::vector<std::string> m_argv;
    std::vector<std::string> m_environment;

    // Script body fed over the standard input in the inline mode.
    std::string m_input;

    // Guards the launches, the termination and the staged script.
    mutable std::mutex m_command_mutex;
    boost::optional<boost::filesystem::path> m_staged;

    std::atomic<bool> m_started;
    std::atomic<bool> m_closed;
    std::atomic<bool> m_stopping;

    // Set from the launch until the run is collected.
    std::atomic<bool> m_running;

    std::atomic<pid_t> m_pid;
    std::atomic<int> m_exit_code;
    std::atomic<unsigned int> m_restarts;

    synchronized<detail::process::process_group_t> m_group;
    synchronized<streams_t> m_streams;

    // Shared by all the runs when the output goes to a file.
    std::shared_ptr<api::stream_t> m_file_stream;

    // Derived from the caller's context, cancelled on close.
    std::shared_ptr<cancellation_t> m_cancellation;
    cancellation_t::subscription_t m_subscription;

    completion_t m_completion;

    std::thread m_watcher;

    synchronized<std::shared_ptr<detail::process::feeder_t>> m_feeder;
};

}} // namespace warden::process

#endif
