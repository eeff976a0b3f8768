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

#ifndef WARDEN_FORWARDS_HPP
#define WARDEN_FORWARDS_HPP

#include <map>
#include <memory>
#include <string>

// Third-party forwards

namespace blackhole {
inline namespace v1 {

class logger_t;
class root_logger_t;

}  // namespace v1
}  // namespace blackhole

namespace warden {

class cancellation_t;

typedef std::map<std::string, std::string> string_map_t;

} // namespace warden

namespace warden { namespace api {

struct handle_t;
struct stream_t;

}} // namespace warden::api

namespace warden { namespace process {

class builder_t;
class completion_t;
class process_t;
class runner_t;

struct spec_t;

}} // namespace warden::process

namespace warden { namespace logging {

enum priorities: int {
    debug   =  0,
    info    =  1,
    warning =  2,
    error   =  3
};

// Import the logger in our namespace.
using blackhole::logger_t;

}} // namespace warden::logging

#endif
