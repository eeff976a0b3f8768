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

#include "warden/process/spec.hpp"

#include "warden/defaults.hpp"
#include "warden/detail/process/launcher.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/filesystem/operations.hpp>

#include <set>

using namespace warden;
using namespace warden::process;

namespace fs = boost::filesystem;

namespace {

// Words which are handled by the shell itself and never looked up in PATH.
const std::set<std::string> kShellWords = {
    "!", "[[", "]]", "{", "}", ".", ":", "[", "alias", "bg", "break", "builtin", "case", "cd",
    "command", "compgen", "complete", "continue", "declare", "dirs", "disown", "do", "done", "echo",
    "elif", "else", "enable", "esac", "eval", "exec", "exit", "export", "false", "fc", "fg", "fi",
    "for", "function", "getopts", "hash", "help", "history", "if", "in", "jobs", "kill", "let",
    "local", "logout", "popd", "printf", "pushd", "pwd", "read", "readonly", "return", "select",
    "set", "shift", "shopt", "source", "suspend", "test", "then", "time", "times", "trap", "true",
    "type", "typeset", "ulimit", "umask", "unalias", "unset", "until", "wait", "while"
};

struct is_script_visitor_t:
    public boost::static_visitor<bool>
{
    bool
    operator()(const direct_t&) const {
        return false;
    }

    template<class T>
    bool
    operator()(const T&) const {
        return true;
    }
};

bool
is_assignment(const std::string& token) {
    const auto position = token.find('=');
    return position != std::string::npos && position > 0 && token.find('/') > position;
}

bool
is_resolvable(const std::string& token, bool script) {
    if(!script) {
        return true;
    }

    return !token.empty() && !kShellWords.count(token) && !is_assignment(token) &&
        token.find_first_of("$`(;|&<>") == std::string::npos;
}

} // namespace

bool
spec_t::is_script() const {
    return boost::apply_visitor(is_script_visitor_t(), execution);
}

std::string
spec_t::body() const {
    // Standard input carries the caller's script alone.
    if(!script.empty() && boost::get<inline_script_t>(&execution)) {
        return script;
    }

    std::string result = script.empty() ? defaults::script_header : script;

    if(!script.empty() && result.back() != '\n' && !commands.empty()) {
        result += '\n';
    }

    for(auto it = commands.begin(); it != commands.end(); ++it) {
        result += boost::algorithm::join(*it, " ");
        result += '\n';
    }

    return result;
}

std::vector<std::string>
spec_t::argv() const {
    if(boost::get<direct_t>(&execution)) {
        return commands.front();
    }

    if(boost::get<inline_script_t>(&execution)) {
        return std::vector<std::string>({ defaults::shell, "-s" });
    }

    return std::vector<std::string>({ defaults::shell });
}

builder_t::builder_t():
    m_mode(script_mode_t::unset),
    m_script_pattern(defaults::script_pattern),
    m_detached(false),
    m_grace(defaults::termination_grace)
{ }

builder_t&
builder_t::command(std::vector<std::string> args) {
    m_commands.push_back(std::move(args));
    return *this;
}

builder_t&
builder_t::commands(const std::vector<std::vector<std::string>>& commands) {
    m_commands.insert(m_commands.end(), commands.begin(), commands.end());
    return *this;
}

builder_t&
builder_t::script(std::string text) {
    m_script = std::move(text);
    return *this;
}

builder_t&
builder_t::file_script() {
    m_mode = script_mode_t::file;
    return *this;
}

builder_t&
builder_t::inline_script() {
    m_mode = script_mode_t::inline_;
    return *this;
}

builder_t&
builder_t::environment(std::string variable) {
    m_environment.push_back(std::move(variable));
    return *this;
}

builder_t&
builder_t::environment(const std::vector<std::string>& variables) {
    m_environment.insert(m_environment.end(), variables.begin(), variables.end());
    return *this;
}

builder_t&
builder_t::output_file(std::string path) {
    m_output_file = std::move(path);
    return *this;
}

builder_t&
builder_t::restart(unsigned int limit, std::chrono::milliseconds interval) {
    m_restart = restart_policy_t { limit, interval };
    return *this;
}

builder_t&
builder_t::staging_directory(fs::path directory) {
    m_staging_directory = std::move(directory);
    return *this;
}

builder_t&
builder_t::script_pattern(std::string pattern) {
    m_script_pattern = std::move(pattern);
    return *this;
}

builder_t&
builder_t::detached(bool value) {
    m_detached = value;
    return *this;
}

builder_t&
builder_t::grace(std::chrono::milliseconds value) {
    m_grace = value;
    return *this;
}

builder_t&
builder_t::label(const std::string& key, std::string value) {
    m_labels[key] = std::move(value);
    return *this;
}

builder_t&
builder_t::logger(std::shared_ptr<logging::logger_t> log) {
    m_logger = std::move(log);
    return *this;
}

spec_t
builder_t::build() const {
    if(m_commands.empty() && m_script.empty()) {
        throw error_t(error::no_command, "no command or script to run");
    }

    spec_t spec;

    spec.commands = m_commands;
    spec.script   = m_script;

    switch(m_mode) {
    case script_mode_t::inline_:
        spec.execution = inline_script_t();
        break;
    case script_mode_t::file:
        spec.execution = file_script_t();
        break;
    case script_mode_t::unset:
        if(m_script.empty()) {
            spec.execution = direct_t();
        } else {
            spec.execution = file_script_t();
        }
    }

    const bool script = spec.is_script();

    if(!script && m_commands.size() > 1) {
        throw error_t(error::multiple_commands, "{} commands given without a script mode",
            m_commands.size());
    }

    for(auto it = m_commands.begin(); it != m_commands.end(); ++it) {
        if(it->empty() || it->front().empty()) {
            throw error_t(error::no_command, "empty command");
        }

        const auto& name = it->front();

        if(is_resolvable(name, script) && !detail::process::resolve(name)) {
            throw error_t(error::command_not_found, "command '{}' not found", name);
        }
    }

    std::set<std::string> keys;

    for(auto it = m_environment.begin(); it != m_environment.end(); ++it) {
        const auto position = it->find('=');

        if(position == std::string::npos || position == 0 ||
           it->find('=', position + 1) != std::string::npos)
        {
            throw error_t(error::invalid_environment, "invalid environment variable '{}'", *it);
        }

        if(!keys.insert(it->substr(0, position)).second) {
            throw error_t(error::duplicate_environment, "duplicate environment variable '{}'",
                it->substr(0, position));
        }
    }

    spec.environment = m_environment;
    spec.output_file = m_output_file;
    spec.restart     = m_restart;

    if(spec.restart && spec.restart->interval == std::chrono::milliseconds::zero()) {
        spec.restart->interval = defaults::restart_interval;
    }

    spec.staging_directory = m_staging_directory ? *m_staging_directory : fs::temp_directory_path();
    spec.script_pattern    = m_script_pattern.empty() ? defaults::script_pattern : m_script_pattern;

    spec.detached = m_detached;
    spec.grace    = m_grace;
    spec.labels   = m_labels;
    spec.logger   = m_logger;

    return spec;
}
