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

#include "warden/detail/process/launcher.hpp"

#include "warden/format.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <array>

#include <csignal>
#include <cstdlib>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __APPLE__
    #include <crt_externs.h>
    #define environ (*_NSGetEnviron())
#else
    extern char** environ;
#endif

using namespace warden;
using namespace warden::detail::process;

namespace {

typedef std::array<int, 2> pipe_type;

struct descriptors_t {
    std::vector<int> fds;

   ~descriptors_t() {
        for(auto it = fds.begin(); it != fds.end(); ++it) {
            if(*it >= 0) {
                ::close(*it);
            }
        }
    }

    pipe_type
    pipe(const char* what) {
        pipe_type pipes;

        if(::pipe2(pipes.data(), O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::system_category(),
                warden::format("unable to create {} pipe", what));
        }

        fds.push_back(pipes[0]);
        fds.push_back(pipes[1]);

        return pipes;
    }

    int
    open(const std::string& path, int flags, ::mode_t mode) {
        const int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);

        if(fd < 0) {
            throw std::system_error(errno, std::system_category(),
                warden::format("unable to open '{}'", path));
        }

        fds.push_back(fd);

        return fd;
    }

    // Transfers the ownership to the caller.
    int
    release(int fd) {
        for(auto it = fds.begin(); it != fds.end(); ++it) {
            if(*it == fd) {
                *it = -1;
            }
        }

        return fd;
    }
};

std::vector<char*>
make_pointers(const std::vector<std::string>& strings) {
    std::vector<char*> result;

    for(auto it = strings.begin(); it != strings.end(); ++it) {
        result.push_back(const_cast<char*>(it->c_str()));
    }

    result.push_back(nullptr);

    return result;
}

bool
is_executable(const std::string& path) {
    struct stat info;

    return ::stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

// Only async-signal-safe calls from here on.
void
exec_child(const launch_options_t& options, int input, int output, int error, int report,
           const char* path, char* const* argv, char* const* envp)
{
    if(options.group) {
        ::setpgid(0, 0);
    }

    if(::dup2(input, STDIN_FILENO) < 0 || ::dup2(output, STDOUT_FILENO) < 0 ||
       ::dup2(error, STDERR_FILENO) < 0)
    {
        const int ec = errno;
        (void)::write(report, &ec, sizeof(ec));
        ::_exit(127);
    }

    // Unblock all the signals

    sigset_t sigset;

    ::sigfillset(&sigset);
    ::sigprocmask(SIG_UNBLOCK, &sigset, nullptr);

    ::signal(SIGPIPE, SIG_DFL);

    ::execve(path, argv, envp);

    const int ec = errno;
    (void)::write(report, &ec, sizeof(ec));
    ::_exit(127);
}

} // namespace

auto
warden::detail::process::resolve(const std::string& name, const std::string& path)
    -> boost::optional<std::string>
{
    if(name.empty()) {
        return boost::none;
    }

    if(name.find('/') != std::string::npos) {
        if(is_executable(name)) {
            return name;
        }

        return boost::none;
    }

    std::vector<std::string> directories;

    boost::algorithm::split(directories, path, boost::algorithm::is_any_of(":"));

    for(auto it = directories.begin(); it != directories.end(); ++it) {
        const auto candidate = (it->empty() ? std::string(".") : *it) + "/" + name;

        if(is_executable(candidate)) {
            return candidate;
        }
    }

    return boost::none;
}

auto
warden::detail::process::resolve(const std::string& name) -> boost::optional<std::string> {
    const char* path = std::getenv("PATH");

    return resolve(name, path ? path : "/usr/local/bin:/usr/bin:/bin");
}

auto
warden::detail::process::merge_environment(const std::vector<std::string>& overrides)
    -> std::vector<std::string>
{
    std::vector<std::string> result;
    std::map<std::string, std::size_t> index;

    for(char** ptr = environ; *ptr != nullptr; ++ptr) {
        const std::string entry(*ptr);
        const auto key = entry.substr(0, entry.find('='));

        if(index.count(key)) {
            continue;
        }

        index[key] = result.size();
        result.push_back(entry);
    }

    for(auto it = overrides.begin(); it != overrides.end(); ++it) {
        const auto key = it->substr(0, it->find('='));
        const auto existing = index.find(key);

        if(existing != index.end()) {
            result[existing->second] = *it;
        } else {
            index[key] = result.size();
            result.push_back(*it);
        }
    }

    return result;
}

auto
warden::detail::process::launch(const launch_options_t& options) -> launched_t {
    if(options.argv.empty()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
            "unable to launch an empty command");
    }

    const auto target = resolve(options.argv.front());

    if(!target) {
        throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
            warden::format("unable to find executable '{}'", options.argv.front()));
    }

    // Prepare the command line and the environment before forking.

    auto argv = make_pointers(options.argv);
    auto envp = make_pointers(options.environment);

    descriptors_t descriptors;

    launched_t result = { 0, -1, -1, -1 };

    int input, output, error;

    if(options.input) {
        const auto pipes = descriptors.pipe("an input");

        input = pipes[0];
        result.input = pipes[1];
    } else {
        input = descriptors.open("/dev/null", O_RDONLY, 0);
    }

    if(options.output_file) {
        output = error = descriptors.open(*options.output_file, O_WRONLY | O_CREAT | O_APPEND, 0644);
    } else {
        const auto pipes = descriptors.pipe("an output");

        output = pipes[1];
        result.output = pipes[0];

        if(options.combine) {
            error = output;
        } else {
            const auto errors = descriptors.pipe("an error");

            error = errors[1];
            result.error = errors[0];
        }
    }

    const auto report = descriptors.pipe("a report");

    const pid_t pid = ::fork();

    if(pid < 0) {
        throw std::system_error(errno, std::system_category(), "unable to fork");
    }

    if(pid == 0) {
        exec_child(options, input, output, error, report[1], target->c_str(), argv.data(), envp.data());
    }

    if(options.group) {
        // The child does the same, so that the group exists whichever side runs first. EACCES means
        // that the child has already called exec.
        (void)::setpgid(pid, pid);
    }

    ::close(descriptors.release(report[1]));

    int ec = 0;
    ssize_t length;

    do {
        length = ::read(report[0], &ec, sizeof(ec));
    } while(length < 0 && errno == EINTR);

    if(length == sizeof(ec)) {
        int status = 0;

        while(::waitpid(pid, &status, 0) < 0 && errno == EINTR);

        throw std::system_error(ec, std::system_category(),
            warden::format("unable to execute '{}'", options.argv.front()));
    }

    result.pid = pid;

    if(result.input >= 0) {
        descriptors.release(result.input);
    }

    if(result.output >= 0) {
        descriptors.release(result.output);
    }

    if(result.error >= 0) {
        descriptors.release(result.error);
    }

    return result;
}
