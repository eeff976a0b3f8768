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

#ifndef WARDEN_COMMON_HPP
#define WARDEN_COMMON_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#define BOOST_FILESYSTEM_VERSION 3
#define BOOST_FILESYSTEM_NO_DEPRECATED

#if !defined(WARDEN_DEBUG)
    #define BOOST_DISABLE_ASSERTS
#endif

#include <boost/assert.hpp>
#include <boost/version.hpp>

#define WARDEN_DECLARE_NONCOPYABLE(_name_)      \
    _name_(const _name_& other) = delete;       \
                                                \
    _name_&                                     \
    operator=(const _name_& other) = delete;

#include "warden/errors.hpp"
#include "warden/forwards.hpp"

#endif
