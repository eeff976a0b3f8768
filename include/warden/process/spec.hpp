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

#ifndef WARDEN_PROCESS_SPEC_HPP
#define WARDEN_PROCESS_SPEC_HPP

#include "warden/common.hpp"

#include <chrono>

#include <boost/filesystem/path.hpp>
#include <boost/optional/optional.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/variant.hpp>

namespace warden { namespace process {

// Execution strategies.

// The single command is executed as is.
struct direct_t { };

// The script is fed to the shell over its standard input.
struct inline_script_t { };

// The script is staged in a temporary file, which is passed to the shell.
struct file_script_t { };

typedef boost::variant<direct_t, inline_script_t, file_script_t> execution_t;

struct restart_policy_t {
    // Maximum number of restarts after the initial run.
    unsigned int limit;

    std::chrono::milliseconds interval;
};

// Validated and immutable description of what to run and how. Produced by builder_t.
struct spec_t {
    typedef std::vector<std::string> command_type;

    std::vector<command_type> commands;

    // Complete script provided by the caller, used verbatim instead of the commands.
    std::string script;

    execution_t execution;

    // KEY=VALUE overrides merged over the inherited environment.
    std::vector<std::string> environment;

    // Both output streams are appended to this file when set, otherwise they are piped.
    boost::optional<std::string> output_file;

    boost::optional<restart_policy_t> restart;

    boost::filesystem::path staging_directory;
    std::string script_pattern;

    // Whether backgrounded descendants are allowed to outlive the process.
    bool detached;

    // Time between SIGTERM and SIGKILL when the process is closed.
    std::chrono::milliseconds grace;

    // Attached to every log record of the process.
    string_map_t labels;

    std::shared_ptr<logging::logger_t> logger;

    bool
    is_script() const;

    // The script body to run: the caller's script, or the strict-mode header followed by one line
    // per command. The commands are appended to the caller's script in the file-backed mode only.
    std::string
    body() const;

    // Command line of the first run, except for the staged script path.
    std::vector<std::string>
    argv() const;
};

class builder_t {
public:
    builder_t();

    builder_t&
    command(std::vector<std::string> args);

    builder_t&
    commands(const std::vector<std::vector<std::string>>& commands);

    // Complete script. Enables the file-backed script mode unless another script mode is chosen.
    builder_t&
    script(std::string text);

    builder_t&
    file_script();

    builder_t&
    inline_script();

    // KEY=VALUE
    builder_t&
    environment(std::string variable);

    builder_t&
    environment(const std::vector<std::string>& variables);

    builder_t&
    output_file(std::string path);

    // A zero interval falls back to the default one.
    builder_t&
    restart(unsigned int limit, std::chrono::milliseconds interval);

    builder_t&
    staging_directory(boost::filesystem::path directory);

    builder_t&
    script_pattern(std::string pattern);

    builder_t&
    detached(bool value);

    builder_t&
    grace(std::chrono::milliseconds value);

    builder_t&
    label(const std::string& key, std::string value);

    builder_t&
    logger(std::shared_ptr<logging::logger_t> log);

    // Validates the options. Throws error_t with one of the spec_errors.
    spec_t
    build() const;

private:
    enum class script_mode_t {
        unset,
        file,
        inline_
    };

    std::vector<std::vector<std::string>> m_commands;
    std::string m_script;
    script_mode_t m_mode;

    std::vector<std::string> m_environment;
    boost::optional<std::string> m_output_file;
    boost::optional<restart_policy_t> m_restart;
    boost::optional<boost::filesystem::path> m_staging_directory;
    std::string m_script_pattern;
    bool m_detached;
    std::chrono::milliseconds m_grace;
    string_map_t m_labels;
    std::shared_ptr<logging::logger_t> m_logger;
};

}} // namespace warden::process

#endif
