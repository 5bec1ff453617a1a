//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/multipart.hpp"

#include <array>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace rcfacade;

static constexpr std::size_t boundary_random_size = 16;  // bytes

static constexpr std::string_view crlf = "\r\n";

// Quoted-string values in Content-Disposition can't contain double quotes or line breaks.
// Encode them the same way browsers do.
static void append_quoted(std::string& to, std::string_view value)
{
    to += '"';
    for (char c : value)
    {
        if (c == '"')
            to += "%22";
        else if (c == '\r')
            to += "%0D";
        else if (c == '\n')
            to += "%0A";
        else
            to += c;
    }
    to += '"';
}

std::string rcfacade::generate_multipart_boundary()
{
    static constexpr char hex_digits[] = "0123456789abcdef";

    // A boundary colliding with file contents would corrupt the request,
    // so use a strong random source
    std::array<unsigned char, boundary_random_size> random_bytes{};
    int ec = RAND_bytes(random_bytes.data(), random_bytes.size());
    if (ec <= 0)
        throw std::runtime_error("Generating multipart boundary: RAND_bytes");

    std::string res = "rcfacade-";
    for (unsigned char b : random_bytes)
    {
        res += hex_digits[b >> 4];
        res += hex_digits[b & 0x0f];
    }
    return res;
}

void multipart_form_builder::open_part(std::string_view name)
{
    body_ += "--";
    body_ += boundary_;
    body_ += crlf;
    body_ += "Content-Disposition: form-data; name=";
    append_quoted(body_, name);
}

multipart_form_builder& multipart_form_builder::add_field(std::string_view name, std::string_view value)
{
    open_part(name);
    body_ += crlf;
    body_ += crlf;
    body_ += value;
    body_ += crlf;
    return *this;
}

multipart_form_builder& multipart_form_builder::add_file(
    std::string_view name,
    std::string_view filename,
    std::string_view content_type,
    std::string_view content
)
{
    open_part(name);
    body_ += "; filename=";
    append_quoted(body_, filename);
    body_ += crlf;
    body_ += "Content-Type: ";
    body_ += content_type.empty() ? std::string_view("application/octet-stream") : content_type;
    body_ += crlf;
    body_ += crlf;
    body_ += content;
    body_ += crlf;
    return *this;
}

std::string multipart_form_builder::build() &&
{
    body_ += "--";
    body_ += boundary_;
    body_ += "--";
    body_ += crlf;
    return std::move(body_);
}
