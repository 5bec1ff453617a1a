//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef RCFACADE_INCLUDE_UTIL_MULTIPART_HPP
#define RCFACADE_INCLUDE_UTIL_MULTIPART_HPP

#include <string>
#include <string_view>
#include <utility>

namespace rcfacade {

// Generates a random boundary, suitable for multipart bodies
std::string generate_multipart_boundary();

// A builder for multipart/form-data request bodies (RFC 7578)
class multipart_form_builder
{
    std::string boundary_;
    std::string body_;

    void open_part(std::string_view name);

public:
    // Uses a random boundary
    multipart_form_builder() : multipart_form_builder(generate_multipart_boundary()) {}

    // boundary must not appear in any of the part contents
    explicit multipart_form_builder(std::string boundary) : boundary_(std::move(boundary)) {}

    // Adds a plain text field
    multipart_form_builder& add_field(std::string_view name, std::string_view value);

    // Adds a file. If content_type is empty, application/octet-stream is used
    multipart_form_builder& add_file(
        std::string_view name,
        std::string_view filename,
        std::string_view content_type,
        std::string_view content
    );

    // The value for the Content-Type header of the request
    std::string content_type() const { return "multipart/form-data; boundary=" + boundary_; }

    // Returns the composed body. The builder can't be used after this
    std::string build() &&;
};

}  // namespace rcfacade

#endif
