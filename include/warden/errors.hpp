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

#ifndef WARDEN_ERRORS_HPP
#define WARDEN_ERRORS_HPP

#include "warden/format.hpp"

#include <system_error>
#include <type_traits>

namespace warden { namespace error {

enum spec_errors {
    no_command = 1,
    multiple_commands,
    command_not_found,
    invalid_environment,
    duplicate_environment
};

enum process_errors {
    already_started = 1,
    not_started,
    aborted
};

enum reader_errors {
    no_stream_selected = 1,
    line_too_long,
    stream_closed
};

enum runner_errors {
    already_running = 1
};

enum cancellation_errors {
    canceled = 1,
    deadline_exceeded
};

auto
make_error_code(spec_errors code) -> std::error_code;

auto
make_error_code(process_errors code) -> std::error_code;

auto
make_error_code(reader_errors code) -> std::error_code;

auto
make_error_code(runner_errors code) -> std::error_code;

auto
make_error_code(cancellation_errors code) -> std::error_code;

// Exit outcomes of a watched child. The value of an exit error is the exit status, the value of a
// signal error is the number of the signal which has terminated the child.

auto
exit_category() -> const std::error_category&;

auto
signal_category() -> const std::error_category&;

auto
make_exit_error(int status) -> std::error_code;

auto
make_signal_error(int signal) -> std::error_code;

// Generic exception

struct error_t:
    public std::system_error
{
    static const std::error_code kInvalidArgumentErrorCode;

    template<class... Args>
    error_t(const std::string& fmt, const Args&... args):
        std::system_error(kInvalidArgumentErrorCode, warden::format(fmt, args...))
    {}

    template<class... Args>
    error_t(std::error_code ec, const std::string& fmt, const Args&... args):
        std::system_error(std::move(ec), warden::format(fmt, args...))
    {}

    template<class E, class... Args, class = typename std::enable_if<
        std::is_error_code_enum<E>::value || std::is_error_condition_enum<E>::value
    >::type>
    error_t(const E err, const std::string& fmt, const Args&... args):
        std::system_error(make_error_code(err), warden::format(fmt, args...))
    {}
};

std::string
to_string(const std::system_error& e);

} // namespace error

using error::error_t;

} // namespace warden

namespace std {

template<>
struct is_error_code_enum<warden::error::spec_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<warden::error::process_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<warden::error::reader_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<warden::error::runner_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<warden::error::cancellation_errors>:
    public true_type
{ };

} // namespace std

#endif
