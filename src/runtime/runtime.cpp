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

#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <blackhole/root.hpp>

#include "warden/cancellation.hpp"
#include "warden/common.hpp"
#include "warden/defaults.hpp"
#include "warden/errors.hpp"
#include "warden/logging.hpp"

#include "warden/executor/asio.hpp"

#include "warden/logging/setup.hpp"

#include "warden/process/process.hpp"
#include "warden/process/reader.hpp"
#include "warden/process/runner.hpp"
#include "warden/process/spec.hpp"
#include "warden/process/staging.hpp"

#include "signal.hpp"

using namespace warden;

namespace po = boost::program_options;

namespace {

const int kTimeoutExitCode = 124;
const int kSignalExitBase  = 128;

const std::chrono::milliseconds kRestartPollInterval(50);

int
exit_code_of(const std::error_code& ec, int exit_code) {
    if(!ec) {
        return EXIT_SUCCESS;
    }

    if(ec == error::deadline_exceeded) {
        return kTimeoutExitCode;
    }

    if(ec.category() == error::exit_category()) {
        return ec.value();
    }

    if(ec.category() == error::signal_category()) {
        return kSignalExitBase + ec.value();
    }

    return exit_code > 0 ? exit_code : EXIT_FAILURE;
}

// Streams the standard output of the current run to stdout and its standard error to stderr.
void
pump(const std::shared_ptr<cancellation_t>& cancellation, process::process_t& process,
     logging::logger_t& log)
{
    process::read_options_t errors;

    errors.read_stderr = true;
    errors.on_line = [](const std::string& line) {
        std::cerr << line << std::endl;
    };

    std::error_code stderr_ec;

    std::thread stderr_thread([&]() {
        stderr_ec = process::read(cancellation, process, errors);
    });

    process::read_options_t output;

    output.read_stdout = true;
    output.on_line = [](const std::string& line) {
        std::cout << line << std::endl;
    };

    const auto stdout_ec = process::read(cancellation, process, output);

    stderr_thread.join();

    for(const auto& ec: { stdout_ec, stderr_ec }) {
        if(ec && ec != error::aborted && ec != error::canceled && ec != error::deadline_exceeded) {
            WARDEN_LOG_WARNING(log, "unable to read the output - {}", ec.message());
        }
    }
}

int
run_command(const std::shared_ptr<cancellation_t>& cancellation, process::builder_t& builder,
            logging::logger_t& log)
{
    process::process_t process(builder.build());

    process.start(cancellation);

    std::error_code last;
    unsigned int run = 0;

    while(true) {
        pump(cancellation, process, log);

        std::error_code outcome;

        const auto status = process.wait().next(*cancellation, outcome);

        if(status == process::completion_status::canceled) {
            last = cancellation->error();
            break;
        }

        if(status == process::completion_status::closed) {
            break;
        }

        last = outcome;

        if(!outcome) {
            break;
        }

        WARDEN_LOG_WARNING(log, "run {} of process {} failed - {}", run, process.pid(),
            outcome.message());

        // Wait for the next run to replace the streams, or for the watcher to give up.
        while(process.restarts() == run && !process.wait().closed() && !cancellation->done()) {
            cancellation->wait_for(kRestartPollInterval);
        }

        if(process.restarts() == run) {
            continue;
        }

        run = process.restarts();
    }

    process.close();

    return exit_code_of(last, process.exit_code());
}

int
run_script(const std::shared_ptr<cancellation_t>& cancellation, const std::string& script,
           bool detached, logging::logger_t& log)
{
    process::runner_t runner;

    const auto result = runner.run(cancellation, script, [&](process::builder_t& builder) {
        builder.detached(detached);
    });

    if(result.output) {
        std::cout << *result.output << std::flush;
    }

    if(result.error) {
        WARDEN_LOG_ERROR(log, "script failed - {}", result.error.message());
    }

    return exit_code_of(result.error, result.exit_code);
}

} // namespace

int
main(int argc, char* argv[]) {
    po::options_description general_options("General options");
    po::options_description execution_options("Execution options");
    po::options_description hidden_options;
    po::positional_options_description positional;
    po::variables_map vm;

    general_options.add_options()
        ("help,h", "show this message")
        ("configuration,c", po::value<std::string>(), "location of the configuration file")
        ("verbosity,v", po::value<std::string>()->default_value(defaults::log_verbosity),
            "logging verbosity: debug, info, warning or error");

    execution_options.add_options()
        ("script,s", po::value<std::string>(), "script text to run")
        ("file,f", po::value<std::string>(), "location of a script file to run")
        ("timeout,t", po::value<double>()->default_value(0), "timeout in seconds, zero for none")
        ("sweep", po::bool_switch()->default_value(false),
            "remove scripts and captures left in the runner directory by a crashed run")
        ("detached,d", po::bool_switch()->default_value(false),
            "let backgrounded sub-commands outlive the run")
        ("inline", po::bool_switch()->default_value(false),
            "feed the script to the shell over its standard input and stream its output")
        ("restart-limit", po::value<unsigned int>(), "restart a failed command up to this many times")
        ("restart-interval", po::value<unsigned int>()->default_value(0),
            "milliseconds between restarts");

    hidden_options.add_options()
        ("command", po::value<std::vector<std::string>>(), "command to run");

    positional.add("command", -1);

    po::options_description cmdline_options;
    cmdline_options.add(general_options).add(execution_options).add(hidden_options);

    try {
        po::store(po::command_line_parser(argc, argv)
            .options(cmdline_options)
            .positional(positional)
            .run(), vm);

        if(vm.count("configuration")) {
            const auto path = vm["configuration"].as<std::string>();

            std::ifstream stream(path);

            if(!stream) {
                std::cerr << warden::format("ERROR: unable to open the configuration file '{}'.", path)
                          << std::endl;
                return EXIT_FAILURE;
            }

            po::store(po::parse_config_file(stream, execution_options), vm);
        }

        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << warden::format("ERROR: {}.", e.what()) << std::endl;
        return EXIT_FAILURE;
    }

    if(vm.count("help")) {
        std::cout << warden::format("USAGE: {} [options] [--] [command [args...]]", argv[0])
                  << std::endl;
        std::cout << general_options << execution_options;
        return EXIT_SUCCESS;
    }

    // Validation

    const int sources = vm.count("script") + vm.count("file") + vm.count("command");

    if(sources != 1) {
        std::cerr << "ERROR: exactly one of a script, a script file or a command must be specified."
                  << std::endl;
        return EXIT_FAILURE;
    }

    // Logging

    std::shared_ptr<logging::logger_t> root;

    try {
        root = logging::make_console_logger(logging::parse_verbosity(vm["verbosity"].as<std::string>()));
    } catch(const std::system_error& e) {
        std::cerr << warden::format("ERROR: unable to initialize the logging - {}.", error::to_string(e))
                  << std::endl;
        return EXIT_FAILURE;
    }

    logging::set_default(root);

    // Signal handling.

    auto cancellation = cancellation_t::with_cancel(cancellation_t::background());

    runtime::signal_watcher_t watcher(executor::shared().loop(), {SIGINT, SIGTERM, SIGQUIT, SIGHUP},
        cancellation, root);

    const double timeout = vm["timeout"].as<double>();

    if(timeout > 0) {
        cancellation = cancellation_t::with_timeout(cancellation,
            std::chrono::duration_cast<cancellation_t::clock_type::duration>(
                std::chrono::duration<double>(timeout)));
    }

    std::string script;

    if(vm.count("script")) {
        script = vm["script"].as<std::string>();
    } else if(vm.count("file")) {
        const auto path = vm["file"].as<std::string>();

        std::ifstream stream(path);

        if(!stream) {
            WARDEN_LOG_ERROR(root, "unable to open script file '{}'", path);
            return EXIT_FAILURE;
        }

        script.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    }

    const bool detached = vm["detached"].as<bool>();

    if(vm["sweep"].as<bool>()) {
        process::runner_t runner;

        const auto removed =
            process::remove_staged_files(runner.directory(), defaults::script_pattern, *root) +
            process::remove_staged_files(runner.directory(), defaults::runner_pattern, *root);

        WARDEN_LOG_INFO(root, "removed {} stale file(s) from '{}'", removed,
            runner.directory().string());
    }

    try {
        if(!vm.count("command") && !vm["inline"].as<bool>() && !vm.count("restart-limit")) {
            return run_script(cancellation, script, detached, *root);
        }

        process::builder_t builder;

        if(vm.count("command")) {
            builder.command(vm["command"].as<std::vector<std::string>>());
        } else {
            builder.script(script).inline_script();
        }

        builder.detached(detached).logger(root);

        if(vm.count("restart-limit")) {
            builder.restart(vm["restart-limit"].as<unsigned int>(),
                std::chrono::milliseconds(vm["restart-interval"].as<unsigned int>()));
        }

        return run_command(cancellation, builder, *root);
    } catch(const std::system_error& e) {
        WARDEN_LOG_ERROR(root, "unable to run - {}", error::to_string(e));
        return EXIT_FAILURE;
    }
}
