//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_UTIL_BASE64_HPP
#define RCFACADE_INCLUDE_UTIL_BASE64_HPP

#include <string>
#include <string_view>

#include "error.hpp"

namespace rcfacade {

// Decodes a padded, standard-alphabet base64 string (RFC 4648, section 4)
// into raw bytes. Whitespace is not allowed. Fails with errc::invalid_base64.
result<std::string> base64_decode(std::string_view input);

}  // namespace rcfacade

#endif
