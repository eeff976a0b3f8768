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

#include "warden/defaults.hpp"

using namespace warden;

const std::string defaults::shell            = "bash";
const std::string defaults::script_pattern   = "warden-*.bash";

const std::string defaults::script_header =
    "#!/bin/bash\n"
    "\n"
    "# do not mask errors in a pipeline\n"
    "set -o pipefail\n"
    "\n"
    "# treat unset variables as an error\n"
    "set -o nounset\n"
    "\n"
    "# exit script whenever it errs\n"
    "set -o errexit\n"
    "\n";

const std::string defaults::runner_directory = "warden-runner";
const std::string defaults::runner_pattern   = "warden-runner-*.out";

const std::chrono::milliseconds defaults::restart_interval  = std::chrono::seconds(5);
const std::chrono::milliseconds defaults::termination_grace = std::chrono::seconds(3);

const std::size_t defaults::scan_buffer_size   = 4096;
const std::size_t defaults::scan_max_line_size = 64 * 1024;

const std::string defaults::log_verbosity = "info";
