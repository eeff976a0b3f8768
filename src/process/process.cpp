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

#include "warden/process/process.hpp"

#include "warden/logging.hpp"

#include "warden/detail/process/launcher.hpp"
#include "warden/detail/process/terminator.hpp"

#include "warden/executor/asio.hpp"

#include "warden/process/staging.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <array>

#include <sys/wait.h>
#include <unistd.h>

using namespace warden;
using namespace warden::process;

using detail::process::process_group_t;

namespace fs = boost::filesystem;

namespace {

std::size_t
completion_capacity(const spec_t& spec) {
    return spec.restart ? spec.restart->limit + 1 : 1;
}

blackhole::attributes_t
make_attributes(const string_map_t& labels) {
    blackhole::attributes_t attributes;

    for(auto it = labels.begin(); it != labels.end(); ++it) {
        attributes.emplace_back(it->first, blackhole::attribute::value_t(it->second));
    }

    return attributes;
}

std::error_code
make_outcome(int status) {
    if(WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        return code == 0 ? std::error_code() : error::make_exit_error(code);
    }

    if(WIFSIGNALED(status)) {
        return error::make_signal_error(WTERMSIG(status));
    }

    return error::make_exit_error(-1);
}

void
stage(const fs::path& path, const std::string& body) {
    fs::ofstream stream(path, std::ios::out | std::ios::trunc | std::ios::binary);

    stream << body;
    stream.flush();

    if(!stream) {
        throw std::system_error(EIO, std::system_category(),
            warden::format("unable to write staged script '{}'", path.string()));
    }
}

} // namespace

process_t::process_t(spec_t spec):
    m_spec(std::move(spec)),
    m_root(m_spec.logger ? m_spec.logger : logging::default_logger()),
    m_log(logging::wrap(*m_root, make_attributes(m_spec.labels))),
    m_argv(m_spec.argv()),
    m_environment(detail::process::merge_environment(m_spec.environment)),
    m_started(false),
    m_closed(false),
    m_stopping(false),
    m_running(false),
    m_pid(0),
    m_exit_code(0),
    m_restarts(0),
    m_subscription(0),
    m_completion(completion_capacity(m_spec))
{
    if(boost::get<inline_script_t>(&m_spec.execution)) {
        m_input = m_spec.body();
    }

    if(boost::get<file_script_t>(&m_spec.execution)) {
        const auto path = create_staged_file(m_spec.staging_directory, m_spec.script_pattern);

        try {
            stage(path, m_spec.body());
        } catch(const std::system_error&) {
            boost::system::error_code ec;

            if(!fs::remove(path, ec) && ec) {
                WARDEN_LOG_WARNING(m_log, "unable to remove staged script '{}' - {}", path.string(),
                    ec.message());
            }

            throw;
        }

        m_staged = path;
        m_argv.push_back(path.string());

        WARDEN_LOG_DEBUG(m_log, "staged script '{}'", path.string());
    }
}

process_t::~process_t() {
    close();

    m_stopping = true;

    if(m_watcher.joinable()) {
        m_watcher.join();
    }

    stop_feeder();

    if(m_cancellation) {
        m_cancellation->unsubscribe(m_subscription);
    }

    std::lock_guard<std::mutex> lock(m_command_mutex);

    remove_staged_script();
}

void
process_t::start(const std::shared_ptr<cancellation_t>& cancellation) {
    if(m_started || m_closed) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_command_mutex);

    if(m_started || m_closed) {
        return;
    }

    m_cancellation = cancellation_t::with_cancel(cancellation);

    try {
        spawn(false);
    } catch(const std::system_error& e) {
        WARDEN_LOG_ERROR(m_log, "unable to start '{}' - {}", boost::algorithm::join(m_argv, " "),
            error::to_string(e));

        m_cancellation.reset();

        throw;
    }

    m_started = true;

    // Invoked right away if the context has already been cancelled.
    m_subscription = m_cancellation->subscribe(std::bind(&process_t::on_cancel, this));

    m_watcher = std::thread(&process_t::watch, this);
}

bool
process_t::started() const {
    return m_started;
}

void
process_t::close() {
    if(!m_started || m_closed) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_command_mutex);

    finish(true);
}

void
process_t::release() {
    if(!m_started || m_closed) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_command_mutex);

    finish(m_running);
}

bool
process_t::closed() const {
    return m_closed;
}

completion_t&
process_t::wait() {
    return m_completion;
}

pid_t
process_t::pid() const {
    return m_pid;
}

int
process_t::exit_code() const {
    return m_exit_code;
}

std::shared_ptr<api::stream_t>
process_t::stdout_stream() const {
    return m_streams->out;
}

std::shared_ptr<api::stream_t>
process_t::stderr_stream() const {
    return m_streams->err;
}

combined_output_t
process_t::start_and_wait(const std::shared_ptr<cancellation_t>& cancellation) {
    std::shared_ptr<api::stream_t> stream;

    {
        std::lock_guard<std::mutex> lock(m_command_mutex);

        if(m_started || m_closed) {
            throw error_t(error::already_started, "process has already been started");
        }

        m_cancellation = cancellation_t::with_cancel(cancellation);

        try {
            spawn(true);
        } catch(const std::system_error& e) {
            WARDEN_LOG_ERROR(m_log, "unable to start '{}' - {}", boost::algorithm::join(m_argv, " "),
                error::to_string(e));

            m_cancellation.reset();

            throw;
        }

        m_started = true;
        m_subscription = m_cancellation->subscribe(std::bind(&process_t::on_cancel, this));

        stream = m_streams->out;
    }

    combined_output_t result;

    std::array<char, 4096> buffer;

    try {
        while(const std::size_t length = stream->read(buffer.data(), buffer.size())) {
            result.output.append(buffer.data(), length);
        }
    } catch(const std::system_error& e) {
        if(e.code() != error::stream_closed) {
            WARDEN_LOG_WARNING(m_log, "unable to read the output of process {} - {}", m_pid.load(),
                error::to_string(e));
        }
    }

    result.error = collect(m_pid);

    m_running = false;

    stop_feeder();
    record(result.error);

    if(!m_completion.deliver(result.error)) {
        WARDEN_LOG_WARNING(m_log, "unable to deliver the outcome of process {}", m_pid.load());
    }

    m_completion.close();

    return result;
}

unsigned int
process_t::restarts() const {
    return m_restarts;
}

const spec_t&
process_t::spec() const {
    return m_spec;
}

boost::optional<fs::path>
process_t::staged_script() const {
    std::lock_guard<std::mutex> lock(m_command_mutex);
    return m_staged;
}

void
process_t::spawn(bool combine) {
    detail::process::launch_options_t options;

    options.argv        = m_argv;
    options.environment = m_environment;
    options.group       = !m_spec.detached;
    options.input       = !m_input.empty();
    options.combine     = combine;

    if(!combine) {
        options.output_file = m_spec.output_file;
    }

    WARDEN_LOG_DEBUG(m_log, "starting '{}'", boost::algorithm::join(m_argv, " "));

    const auto launched = detail::process::launch(options);
    const process_group_t group(launched.pid, options.group);

    streams_t streams;

    try {
        if(options.output_file) {
            if(!m_file_stream) {
                m_file_stream = std::make_shared<detail::process::file_stream_t>(*options.output_file);
            }

            streams.out = streams.err = m_file_stream;
        } else {
            streams.out = std::make_shared<detail::process::pipe_stream_t>(
                executor::shared().loop(), launched.output);

            if(combine) {
                streams.err = streams.out;
            } else {
                streams.err = std::make_shared<detail::process::pipe_stream_t>(
                    executor::shared().loop(), launched.error);
            }
        }
    } catch(const std::system_error&) {
        if(launched.input >= 0) {
            ::close(launched.input);
        }

        if(auto ec = group.kill()) {
            WARDEN_LOG_WARNING(m_log, "unable to kill process {} - {}", launched.pid, ec.message());
        }

        collect(launched.pid);

        throw;
    }

    m_pid = launched.pid;
    m_running = true;

    *m_group.synchronize() = group;
    *m_streams.synchronize() = streams;

    if(launched.input >= 0) {
        auto feeder = std::make_shared<detail::process::feeder_t>(executor::shared().loop(),
            launched.input, m_input, *m_log);

        feeder->start();

        *m_feeder.synchronize() = feeder;
    }

    WARDEN_LOG_INFO(m_log, "started process {}", launched.pid);
}

void
process_t::watch() {
    unsigned int restarts = 0;

    while(true) {
        const auto outcome = collect(m_pid);

        m_running = false;

        stop_feeder();
        record(outcome);

        if(!m_completion.deliver(outcome)) {
            WARDEN_LOG_WARNING(m_log, "unable to deliver the outcome of process {}", m_pid.load());
        }

        if(!outcome) {
            WARDEN_LOG_DEBUG(m_log, "process {} exited successfully", m_pid.load());
            break;
        }

        if(!m_spec.restart) {
            break;
        }

        if(restarts >= m_spec.restart->limit) {
            WARDEN_LOG_WARNING(m_log, "process {} failed, but the restart limit of {} is reached - {}",
                m_pid.load(), m_spec.restart->limit, outcome.message());
            break;
        }

        if(m_stopping || m_cancellation->wait_for(m_spec.restart->interval)) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(m_command_mutex);

            if(m_stopping || m_cancellation->done()) {
                break;
            }

            try {
                spawn(false);
            } catch(const std::system_error& e) {
                WARDEN_LOG_WARNING(m_log, "unable to restart '{}' - {}",
                    boost::algorithm::join(m_argv, " "), error::to_string(e));
                break;
            }

            // The context might have been cancelled while the previous target was still current.
            if(m_cancellation->done()) {
                on_cancel();
            }
        }

        m_restarts = ++restarts;

        WARDEN_LOG_INFO(m_log, "restarted process {}, attempt {} of {}", m_pid.load(), restarts,
            m_spec.restart->limit);
    }

    m_completion.close();
}

void
process_t::stop_feeder() {
    std::shared_ptr<detail::process::feeder_t> feeder;

    m_feeder.synchronize()->swap(feeder);

    if(feeder) {
        feeder->stop();
    }
}

void
process_t::finish(bool terminate) {
    if(m_closed) {
        return;
    }

    m_stopping = true;

    const auto group = *m_group.synchronize();

    if(terminate) {
        WARDEN_LOG_DEBUG(m_log, "closing process {}", group.id());

        std::make_shared<detail::process::terminator_t>(executor::shared().loop(), group,
            m_spec.grace, *m_log)->start().wait();
    } else {
        WARDEN_LOG_DEBUG(m_log, "releasing process {}", group.id());

        // The run is over, the context must not kill what it has left in the background.
        m_cancellation->unsubscribe(m_subscription);
    }

    m_cancellation->cancel();

    const auto streams = *m_streams.synchronize();

    try {
        if(streams.out) {
            streams.out->shutdown();
        }

        if(streams.err) {
            streams.err->shutdown();
        }
    } catch(const std::system_error& e) {
        WARDEN_LOG_WARNING(m_log, "unable to shut the output streams down - {}", error::to_string(e));
    }

    remove_staged_script();

    m_closed = true;
}

std::error_code
process_t::collect(pid_t pid) {
    int status = 0;

    while(::waitpid(pid, &status, 0) < 0) {
        if(errno != EINTR) {
            const std::error_code ec(errno, std::system_category());

            WARDEN_LOG_WARNING(m_log, "unable to collect process {} - {}", pid, ec.message());

            return ec;
        }
    }

    return make_outcome(status);
}

void
process_t::record(const std::error_code& outcome) {
    if(!outcome) {
        return;
    }

    const pid_t pid = m_pid;

    if(outcome.category() == error::signal_category()) {
        m_exit_code = -1;

        if(m_stopping || m_cancellation->done()) {
            WARDEN_LOG_DEBUG(m_log, "process {} has been terminated on cancellation - {}", pid,
                outcome.message());
        } else {
            WARDEN_LOG_WARNING(m_log, "process {} has been terminated for unknown reasons - {}", pid,
                outcome.message());
        }
    } else if(outcome.category() == error::exit_category()) {
        m_exit_code = outcome.value();

        WARDEN_LOG_DEBUG(m_log, "process {} exited with non-zero status {}", pid, outcome.value());
    } else {
        WARDEN_LOG_WARNING(m_log, "unable to wait for process {} - {}", pid, outcome.message());
    }
}

void
process_t::on_cancel() {
    const auto group = *m_group.synchronize();

    if(auto ec = group.kill()) {
        WARDEN_LOG_WARNING(m_log, "unable to kill process {} - {}", group.id(), ec.message());
    }
}

void
process_t::remove_staged_script() {
    if(!m_staged) {
        return;
    }

    boost::system::error_code ec;

    if(!fs::remove(*m_staged, ec) && ec) {
        WARDEN_LOG_WARNING(m_log, "unable to remove staged script '{}' - {}", m_staged->string(),
            ec.message());
    } else {
        WARDEN_LOG_DEBUG(m_log, "removed staged script '{}'", m_staged->string());
    }

    m_staged.reset();
}
