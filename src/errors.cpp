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

#include "warden/errors.hpp"

#include <csignal>

using namespace warden;
using namespace warden::error;

namespace {

struct signal_name_t {
    int signal;
    const char* description;
};

// Descriptions of the signals a script is likely to die from.
const signal_name_t kSignalNames[] = {
    { SIGHUP,  "Hangup"                    },
    { SIGINT,  "Interrupt"                 },
    { SIGQUIT, "Quit"                      },
    { SIGILL,  "Illegal instruction"       },
    { SIGTRAP, "Trace/breakpoint trap"     },
    { SIGABRT, "Aborted"                   },
    { SIGBUS,  "Bus error"                 },
    { SIGFPE,  "Floating point exception"  },
    { SIGKILL, "Killed"                    },
    { SIGUSR1, "User defined signal 1"     },
    { SIGSEGV, "Segmentation fault"        },
    { SIGUSR2, "User defined signal 2"     },
    { SIGPIPE, "Broken pipe"               },
    { SIGALRM, "Alarm clock"               },
    { SIGTERM, "Terminated"                },
    { SIGCHLD, "Child exited"              },
    { SIGCONT, "Continued"                 },
    { SIGSTOP, "Stopped (signal)"          },
    { SIGTSTP, "Stopped"                   },
    { SIGTTIN, "Stopped (tty input)"       },
    { SIGTTOU, "Stopped (tty output)"      },
    { SIGXCPU, "CPU time limit exceeded"   },
    { SIGXFSZ, "File size limit exceeded"  },
    { SIGSYS,  "Bad system call"           }
};

const char*
describe_signal(int signal) {
    for(const auto& entry: kSignalNames) {
        if(entry.signal == signal) {
            return entry.description;
        }
    }

    return nullptr;
}

class spec_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.process.spec";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case warden::error::spec_errors::no_command:
            return "no command";
        case warden::error::spec_errors::multiple_commands:
            return "multiple commands require script mode";
        case warden::error::spec_errors::command_not_found:
            return "command not found";
        case warden::error::spec_errors::invalid_environment:
            return "invalid environment variable format";
        case warden::error::spec_errors::duplicate_environment:
            return "duplicate environment variable";
        default:
            return "warden.process.spec error";
        }
    }
};

class process_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.process";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case warden::error::process_errors::already_started:
            return "process already started";
        case warden::error::process_errors::not_started:
            return "process not started";
        case warden::error::process_errors::aborted:
            return "process aborted";
        default:
            return "warden.process error";
        }
    }
};

class reader_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.process.reader";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case warden::error::reader_errors::no_stream_selected:
            return "at least one of stdout or stderr must be selected";
        case warden::error::reader_errors::line_too_long:
            return "token too long";
        case warden::error::reader_errors::stream_closed:
            return "file already closed";
        default:
            return "warden.process.reader error";
        }
    }
};

class runner_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.process.runner";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case warden::error::runner_errors::already_running:
            return "process already running";
        default:
            return "warden.process.runner error";
        }
    }
};

class cancellation_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.cancellation";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case warden::error::cancellation_errors::canceled:
            return "context canceled";
        case warden::error::cancellation_errors::deadline_exceeded:
            return "context deadline exceeded";
        default:
            return "warden.cancellation error";
        }
    }
};

class exit_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.process.exit";
    }

    virtual
    auto
    message(int code) const -> std::string {
        return warden::format("exit status {}", code);
    }
};

class signal_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "warden.process.signal";
    }

    virtual
    auto
    message(int code) const -> std::string {
        const char* description = describe_signal(code);

        if(description == nullptr) {
            return warden::format("signal: {}", code);
        }

        return warden::format("signal: {}", description);
    }
};

auto
spec_category() -> const std::error_category& {
    static spec_category_t instance;
    return instance;
}

auto
process_category() -> const std::error_category& {
    static process_category_t instance;
    return instance;
}

auto
reader_category() -> const std::error_category& {
    static reader_category_t instance;
    return instance;
}

auto
runner_category() -> const std::error_category& {
    static runner_category_t instance;
    return instance;
}

auto
cancellation_category() -> const std::error_category& {
    static cancellation_category_t instance;
    return instance;
}

} // namespace

namespace warden { namespace error {

auto
make_error_code(spec_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), spec_category());
}

auto
make_error_code(process_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), process_category());
}

auto
make_error_code(reader_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), reader_category());
}

auto
make_error_code(runner_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), runner_category());
}

auto
make_error_code(cancellation_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), cancellation_category());
}

auto
exit_category() -> const std::error_category& {
    static exit_category_t instance;
    return instance;
}

auto
signal_category() -> const std::error_category& {
    static signal_category_t instance;
    return instance;
}

auto
make_exit_error(int status) -> std::error_code {
    return std::error_code(status, exit_category());
}

auto
make_signal_error(int signal) -> std::error_code {
    return std::error_code(signal, signal_category());
}

std::string
to_string(const std::system_error& e) {
    return warden::format("[{}] {}", e.code().value(), e.what());
}

const std::error_code
error_t::kInvalidArgumentErrorCode = std::make_error_code(std::errc::invalid_argument);

}} // namespace warden::error
