//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/multipart.hpp"

#include <boost/test/unit_test.hpp>

#include <string>

using namespace rcfacade;

BOOST_AUTO_TEST_SUITE(multipart)

BOOST_AUTO_TEST_CASE(fields_and_files)
{
    multipart_form_builder builder("xyz");
    builder.add_field("msg", "hello").add_file("file", "a.txt", "text/plain", "abc");

    BOOST_TEST(builder.content_type() == "multipart/form-data; boundary=xyz");
    BOOST_TEST(
        std::move(builder).build() ==
        "--xyz\r\n"
        "Content-Disposition: form-data; name=\"msg\"\r\n"
        "\r\n"
        "hello\r\n"
        "--xyz\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"a.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "abc\r\n"
        "--xyz--\r\n"
    );
}

BOOST_AUTO_TEST_CASE(empty)
{
    multipart_form_builder builder("xyz");
    BOOST_TEST(std::move(builder).build() == "--xyz--\r\n");
}

BOOST_AUTO_TEST_CASE(default_content_type)
{
    multipart_form_builder builder("b");
    builder.add_file("file", "data.bin", "", "\x01\x02");
    auto body = std::move(builder).build();
    BOOST_TEST(body.find("Content-Type: application/octet-stream\r\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(binary_content)
{
    const std::string content("a\0b\r\nc", 6);
    multipart_form_builder builder("b");
    builder.add_file("file", "data.bin", "application/octet-stream", content);
    auto body = std::move(builder).build();
    BOOST_TEST(body.find(content) != std::string::npos);
}

BOOST_AUTO_TEST_CASE(quoted_values_are_escaped)
{
    multipart_form_builder builder("b");
    builder.add_file("file", "we\"ird\r\n.txt", "text/plain", "");
    auto body = std::move(builder).build();
    BOOST_TEST(body.find("filename=\"we%22ird%0D%0A.txt\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(random_boundary)
{
    auto b1 = generate_multipart_boundary();
    auto b2 = generate_multipart_boundary();

    BOOST_TEST(b1.starts_with("rcfacade-"));
    BOOST_TEST(b1.size() == 9u + 32u);
    BOOST_TEST(b1 != b2);

    // The default constructor uses a random boundary
    multipart_form_builder builder;
    BOOST_TEST(builder.content_type().starts_with("multipart/form-data; boundary=rcfacade-"));
}

BOOST_AUTO_TEST_SUITE_END()
