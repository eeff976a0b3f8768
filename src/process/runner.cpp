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

#include "warden/process/runner.hpp"

#include "warden/defaults.hpp"
#include "warden/logging.hpp"

#include "warden/process/process.hpp"
#include "warden/process/staging.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <iterator>

using namespace warden;
using namespace warden::process;

namespace fs = boost::filesystem;

namespace {

struct slot_t {
    explicit
    slot_t(std::atomic<bool>& running_):
        running(running_)
    { }

   ~slot_t() {
        running = false;
    }

    std::atomic<bool>& running;
};

struct capture_t {
    capture_t(fs::path path_, logging::logger_t& log_):
        path(std::move(path_)),
        log(log_)
    { }

   ~capture_t() {
        boost::system::error_code ec;

        if(!fs::remove(path, ec) && ec) {
            WARDEN_LOG_WARNING(log, "unable to remove capture file '{}' - {}", path.string(),
                ec.message());
        }
    }

    std::error_code
    read(std::string& output) const {
        fs::ifstream stream(path, std::ios::in | std::ios::binary);

        if(!stream) {
            return std::error_code(ENOENT, std::system_category());
        }

        output.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());

        if(stream.bad()) {
            return std::error_code(EIO, std::system_category());
        }

        return std::error_code();
    }

    const fs::path path;
    logging::logger_t& log;
};

} // namespace

runner_t::runner_t():
    m_directory(fs::temp_directory_path() / defaults::runner_directory),
    m_grace(defaults::termination_grace),
    m_log(logging::default_logger()),
    m_running(false)
{ }

runner_t::runner_t(fs::path directory, std::chrono::milliseconds grace,
                   std::shared_ptr<logging::logger_t> log):
    m_directory(std::move(directory)),
    m_grace(grace),
    m_log(log ? std::move(log) : logging::default_logger()),
    m_running(false)
{ }

run_result_t
runner_t::run(const std::shared_ptr<cancellation_t>& cancellation, const std::string& script,
              const configure_type& configure)
{
    bool expected = false;

    if(!m_running.compare_exchange_strong(expected, true)) {
        throw error_t(error::already_running, "another script is still running");
    }

    slot_t slot(m_running);

    boost::system::error_code ec;

    fs::create_directories(m_directory, ec);

    if(ec) {
        throw std::system_error(ec.value(), std::system_category(),
            warden::format("unable to create runner directory '{}'", m_directory.string()));
    }

    capture_t capture(create_staged_file(m_directory, defaults::runner_pattern), *m_log);

    builder_t builder;

    builder.script(script)
        .file_script()
        .output_file(capture.path.string())
        .staging_directory(m_directory)
        .grace(m_grace)
        .logger(m_log);

    if(configure) {
        configure(builder);
    }

    process_t process(builder.build());

    process.start(cancellation);

    run_result_t result;

    std::error_code outcome;

    if(process.wait().next(*cancellation, outcome) == completion_status::canceled) {
        result.error = cancellation->error();
        result.exit_code = process.exit_code();

        WARDEN_LOG_DEBUG(m_log, "run of process {} has been cancelled - {}", process.pid(),
            result.error.message());

        process.close();

        return result;
    }

    result.exit_code = process.exit_code();

    // Actions the script has put in the background are left running.
    process.release();

    std::string output;

    if(auto ec = capture.read(output)) {
        if(outcome) {
            WARDEN_LOG_WARNING(m_log, "unable to read capture file '{}' - {}", capture.path.string(),
                ec.message());
            result.error = outcome;
        } else {
            result.error = ec;
        }

        return result;
    }

    result.output = std::move(output);
    result.error  = outcome;

    return result;
}

bool
runner_t::running() const {
    return m_running;
}

const fs::path&
runner_t::directory() const {
    return m_directory;
}
