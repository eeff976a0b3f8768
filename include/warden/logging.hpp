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

#ifndef WARDEN_LOGGING_HPP
#define WARDEN_LOGGING_HPP

#include "warden/common.hpp"
#include "warden/format.hpp"

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/logger.hpp>

#define WARDEN_LOG(__log__, __severity__, ...) \
    ::warden::detail::logging::log(__log__, __severity__, __VA_ARGS__)

#define WARDEN_LOG_DEBUG(__log__, ...) \
    WARDEN_LOG(__log__, ::warden::logging::debug, __VA_ARGS__)

#define WARDEN_LOG_INFO(__log__, ...) \
    WARDEN_LOG(__log__, ::warden::logging::info, __VA_ARGS__)

#define WARDEN_LOG_WARNING(__log__, ...) \
    WARDEN_LOG(__log__, ::warden::logging::warning, __VA_ARGS__)

#define WARDEN_LOG_ERROR(__log__, ...) \
    WARDEN_LOG(__log__, ::warden::logging::error, __VA_ARGS__)

namespace warden { namespace detail { namespace logging {

template<typename T> inline auto logger_ref(T& log) -> T& { return log; }
template<typename T> inline auto logger_ref(T* const log) -> T& { return *log; }
template<typename T> inline auto logger_ref(std::unique_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::unique_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(std::shared_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::shared_ptr<T>& log) -> T& { return *log; }

template<typename T>
auto
make_facade(T&& log) -> blackhole::logger_facade<warden::logging::logger_t> {
    return blackhole::logger_facade<warden::logging::logger_t>(logger_ref(log));
}

template<typename Log, typename Message>
auto
log(Log&& log, warden::logging::priorities severity, Message&& message, const blackhole::attribute_list& attributes) -> void {
    make_facade(log).log(severity, std::forward<Message>(message), attributes);
}

template<typename Log, typename Message, typename... Args>
auto
log(Log&& log, warden::logging::priorities severity, Message&& message, const Args&... args) -> void {
    make_facade(log).log(severity, std::forward<Message>(message), args...);
}

}}}  // namespace warden::detail::logging

namespace warden { namespace logging {

// Process-wide logger used by engines which were not given one explicitly. Discards everything
// until replaced with set_default().
auto
default_logger() -> std::shared_ptr<logger_t>;

auto
set_default(std::shared_ptr<logger_t> log) -> void;

// Wraps the given logger, attaching the attributes to every record.
auto
wrap(logger_t& log, blackhole::attributes_t attributes) -> std::unique_ptr<logger_t>;

}}  // namespace warden::logging

#endif
