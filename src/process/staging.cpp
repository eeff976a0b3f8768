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

#include "warden/process/staging.hpp"

#include "warden/logging.hpp"

#include <boost/filesystem/operations.hpp>

#include <fcntl.h>
#include <fnmatch.h>
#include <unistd.h>

using namespace warden;

namespace fs = boost::filesystem;

namespace {

const unsigned int kCreateAttempts = 100;

std::string
materialize(const std::string& pattern) {
    const auto token = fs::unique_path("%%%%%%%%%%").native();
    const auto position = pattern.rfind('*');

    if(position == std::string::npos) {
        return pattern + token;
    }

    return pattern.substr(0, position) + token + pattern.substr(position + 1);
}

} // namespace

auto
process::create_staged_file(const fs::path& directory, const std::string& pattern) -> fs::path {
    if(pattern.find('/') != std::string::npos) {
        throw error_t(std::make_error_code(std::errc::invalid_argument),
            "invalid staging pattern '{}' - contains a path separator", pattern);
    }

    for(unsigned int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        const auto path = directory / materialize(pattern);
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);

        if(fd >= 0) {
            ::close(fd);
            return path;
        }

        if(errno != EEXIST) {
            throw std::system_error(errno, std::system_category(),
                warden::format("unable to create staged file '{}'", path.string()));
        }
    }

    throw std::system_error(EEXIST, std::system_category(),
        warden::format("unable to create a unique staged file in '{}'", directory.string()));
}

auto
process::remove_staged_files(const fs::path& directory, const std::string& pattern) -> std::size_t {
    return remove_staged_files(directory, pattern, *logging::default_logger());
}

auto
process::remove_staged_files(const fs::path& directory, const std::string& pattern,
                             logging::logger_t& log) -> std::size_t
{
    boost::system::error_code ec;
    std::size_t removed = 0;

    fs::directory_iterator it(directory, ec), end;

    if(ec) {
        WARDEN_LOG_WARNING(log, "unable to list staging directory '{}' - {}", directory.string(),
            ec.message());
        return removed;
    }

    for(; it != end; it.increment(ec)) {
        if(ec) {
            WARDEN_LOG_WARNING(log, "unable to list staging directory '{}' - {}", directory.string(),
                ec.message());
            break;
        }

        const auto filename = it->path().filename().native();

        if(::fnmatch(pattern.c_str(), filename.c_str(), FNM_PERIOD) != 0) {
            continue;
        }

        if(!fs::is_regular_file(it->symlink_status(ec)) || ec) {
            continue;
        }

        if(!fs::remove(it->path(), ec) || ec) {
            WARDEN_LOG_WARNING(log, "unable to remove staged file '{}' - {}", it->path().string(),
                ec ? ec.message() : std::string("no such file"));
            continue;
        }

        WARDEN_LOG_DEBUG(log, "removed staged file '{}'", it->path().string());

        removed++;
    }

    return removed;
}
