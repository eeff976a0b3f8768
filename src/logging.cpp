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

#include "warden/logging.hpp"
#include "warden/logging/setup.hpp"

#include "warden/locked_ptr.hpp"

#include <blackhole/builder.hpp>
#include <blackhole/formatter/string.hpp>
#include <blackhole/handler.hpp>
#include <blackhole/handler/blocking.hpp>
#include <blackhole/record.hpp>
#include <blackhole/root.hpp>
#include <blackhole/sink/console.hpp>
#include <blackhole/wrapper.hpp>

namespace warden { namespace logging {

namespace {

auto
storage() -> synchronized<std::shared_ptr<logger_t>>& {
    static synchronized<std::shared_ptr<logger_t>> instance(
        std::shared_ptr<logger_t>(make_null_logger())
    );

    return instance;
}

} // namespace

auto
default_logger() -> std::shared_ptr<logger_t> {
    return *storage().synchronize();
}

auto
set_default(std::shared_ptr<logger_t> log) -> void {
    BOOST_ASSERT(log);

    storage().synchronize()->swap(log);
}

auto
wrap(logger_t& log, blackhole::attributes_t attributes) -> std::unique_ptr<logger_t> {
    return std::unique_ptr<logger_t>(new blackhole::wrapper_t(log, std::move(attributes)));
}

auto
parse_verbosity(const std::string& verbosity) -> priorities {
    static const std::map<std::string, priorities> mapping = {
        { "debug",   debug   },
        { "info",    info    },
        { "warning", warning },
        { "error",   error   }
    };

    auto it = mapping.find(verbosity);

    if(it == mapping.end()) {
        throw error_t("unknown logging verbosity '{}'", verbosity);
    }

    return it->second;
}

auto
make_console_logger(priorities verbosity) -> std::unique_ptr<blackhole::root_logger_t> {
    auto formatter = blackhole::builder<blackhole::formatter::string_t>(
        "{timestamp} {severity:d}: {message} {...}"
    ).build();

    auto sink = blackhole::builder<blackhole::sink::console_t>()
        .stderr()
        .build();

    std::vector<std::unique_ptr<blackhole::handler_t>> handlers;

    handlers.push_back(blackhole::builder<blackhole::handler::blocking_t>()
        .set(std::move(formatter))
        .add(std::move(sink))
        .build());

    const int threshold = static_cast<int>(verbosity);

    return std::unique_ptr<blackhole::root_logger_t>(new blackhole::root_logger_t(
        [threshold](const blackhole::record_t& record) -> bool {
            return record.severity() >= threshold;
        },
        std::move(handlers)
    ));
}

auto
make_null_logger() -> std::unique_ptr<blackhole::root_logger_t> {
    return std::unique_ptr<blackhole::root_logger_t>(
        new blackhole::root_logger_t(std::vector<std::unique_ptr<blackhole::handler_t>>())
    );
}

}} // namespace warden::logging
