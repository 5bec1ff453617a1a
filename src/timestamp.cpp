//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace rcfacade;
namespace chrono = std::chrono;

namespace {

// A cursor over the input string. All functions return false on mismatch
class cursor
{
    std::string_view input_;
    std::size_t pos_{0};

public:
    explicit cursor(std::string_view input) noexcept : input_(input) {}

    bool at_end() const noexcept { return pos_ == input_.size(); }

    bool peek(char c) const noexcept { return pos_ < input_.size() && input_[pos_] == c; }

    bool consume(char c) noexcept
    {
        if (!peek(c))
            return false;
        ++pos_;
        return true;
    }

    bool peek_digit() const noexcept
    {
        return pos_ < input_.size() && input_[pos_] >= '0' && input_[pos_] <= '9';
    }

    // Reads exactly num_digits decimal digits
    bool digits(std::size_t num_digits, int& output) noexcept
    {
        if (input_.size() - pos_ < num_digits)
            return false;
        int res = 0;
        for (std::size_t i = 0; i < num_digits; ++i)
        {
            char c = input_[pos_ + i];
            if (c < '0' || c > '9')
                return false;
            res = res * 10 + (c - '0');
        }
        pos_ += num_digits;
        output = res;
        return true;
    }

    // Reads one or more digits as a fraction of a second, in milliseconds.
    // Digits beyond millisecond precision are truncated.
    bool fraction(int& millis) noexcept
    {
        if (!peek_digit())
            return false;
        int res = 0;
        int num_digits = 0;
        while (peek_digit())
        {
            if (num_digits < 3)
                res = res * 10 + (input_[pos_] - '0');
            ++num_digits;
            ++pos_;
        }
        for (; num_digits < 3; ++num_digits)
            res *= 10;
        millis = res;
        return true;
    }
};

}  // namespace

result<timestamp_t> rcfacade::parse_timestamp(std::string_view from)
{
    cursor cur(from);
    int year{}, month{}, day{}, hour{}, minute{}, second{}, millis{};

    // Date
    if (!cur.digits(4, year) || !cur.consume('-') || !cur.digits(2, month) || !cur.consume('-') ||
        !cur.digits(2, day))
        RCFACADE_RETURN_ERROR(errc::invalid_timestamp)

    // Time
    if (!cur.consume('T') || !cur.digits(2, hour) || !cur.consume(':') || !cur.digits(2, minute) ||
        !cur.consume(':') || !cur.digits(2, second))
        RCFACADE_RETURN_ERROR(errc::invalid_timestamp)

    // Optional fractional seconds
    if (cur.consume('.') && !cur.fraction(millis))
        RCFACADE_RETURN_ERROR(errc::invalid_timestamp)

    // Zone designator. Numeric offsets are subtracted to get UTC
    chrono::minutes offset{0};
    if (!cur.consume('Z'))
    {
        int sign = 1;
        if (cur.consume('-'))
            sign = -1;
        else if (!cur.consume('+'))
            RCFACADE_RETURN_ERROR(errc::invalid_timestamp)

        int offset_hours{}, offset_minutes{};
        if (!cur.digits(2, offset_hours) || !cur.consume(':') || !cur.digits(2, offset_minutes))
            RCFACADE_RETURN_ERROR(errc::invalid_timestamp)
        if (offset_hours > 18 || offset_minutes > 59)
            RCFACADE_RETURN_ERROR(errc::invalid_timestamp)
        offset = sign * (chrono::hours(offset_hours) + chrono::minutes(offset_minutes));
    }

    // Nothing else is allowed after the zone
    if (!cur.at_end())
        RCFACADE_RETURN_ERROR(errc::invalid_timestamp)

    // Range checks. year_month_day::ok takes into account month lengths and leap years
    chrono::year_month_day ymd{
        chrono::year(year),
        chrono::month(static_cast<unsigned>(month)),
        chrono::day(static_cast<unsigned>(day))
    };
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59)
        RCFACADE_RETURN_ERROR(errc::invalid_timestamp)

    return timestamp_t(chrono::sys_days(ymd)) + chrono::hours(hour) + chrono::minutes(minute) +
           chrono::seconds(second) + chrono::milliseconds(millis) - offset;
}

std::string rcfacade::format_timestamp(timestamp_t input)
{
    auto day_point = chrono::floor<chrono::days>(input);
    chrono::year_month_day ymd{day_point};
    chrono::hh_mm_ss<chrono::milliseconds> time{input - day_point};

    char buff[64]{};
    std::snprintf(
        buff,
        sizeof(buff),
        "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(time.hours().count()),
        static_cast<int>(time.minutes().count()),
        static_cast<int>(time.seconds().count()),
        static_cast<int>(time.subseconds().count())
    );
    return buff;
}
