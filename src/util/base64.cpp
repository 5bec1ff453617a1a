//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/base64.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace rcfacade;

namespace {

constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

// Maps a character to its 6-bit value, or -1 if it's not in the alphabet
constexpr std::array<std::int8_t, 256> make_inverse_table()
{
    std::array<std::int8_t, 256> res{};
    for (auto& v : res)
        v = -1;
    for (std::size_t i = 0; i < alphabet.size(); ++i)
        res[static_cast<unsigned char>(alphabet[i])] = static_cast<std::int8_t>(i);
    return res;
}

constexpr auto inverse_table = make_inverse_table();

int sextet(char c) noexcept { return inverse_table[static_cast<unsigned char>(c)]; }

}  // namespace

result<std::string> rcfacade::base64_decode(std::string_view input)
{
    // Padded input always comes in groups of 4 characters
    if (input.size() % 4u != 0u)
        RCFACADE_RETURN_ERROR(errc::invalid_base64)

    std::string res;
    res.reserve(input.size() / 4u * 3u);

    for (std::size_t pos = 0; pos < input.size(); pos += 4u)
    {
        std::string_view group = input.substr(pos, 4u);
        bool is_last = pos + 4u == input.size();

        // Padding may only appear at the end of the last group
        std::size_t padding = 0u;
        if (is_last)
        {
            if (group[3] == '=')
                ++padding;
            if (padding && group[2] == '=')
                ++padding;
        }

        std::uint32_t bits = 0u;
        for (std::size_t i = 0; i < 4u - padding; ++i)
        {
            int v = sextet(group[i]);
            if (v < 0)
                RCFACADE_RETURN_ERROR(errc::invalid_base64)
            bits = (bits << 6) | static_cast<std::uint32_t>(v);
        }
        bits <<= 6u * padding;

        res.push_back(static_cast<char>((bits >> 16) & 0xffu));
        if (padding < 2u)
            res.push_back(static_cast<char>((bits >> 8) & 0xffu));
        if (padding < 1u)
            res.push_back(static_cast<char>(bits & 0xffu));
    }

    return res;
}
