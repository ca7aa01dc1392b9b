/*
 * Copyright (C) 2017-2026  CZ.NIC, z. s. p. o.
 *
 * This file is part of FRED.
 *
 * FRED is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * FRED is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with FRED.  If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef TIME_UNIT_HH_AA862C0A2A13AEFBE6D015A289BED606//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define TIME_UNIT_HH_AA862C0A2A13AEFBE6D015A289BED606

#include <chrono>
#include <functional>
#include <iosfwd>

namespace TimeUnit {

template <typename Type, typename Tag> class Duration;

template <typename Rep, typename Period, typename Tag>
class Duration<std::chrono::duration<Rep, Period>, Tag>
{
public:
    using Value = std::chrono::duration<Rep, Period>;
    constexpr Duration() = default;
    Duration(const Duration&) = default;
    Duration& operator=(const Duration&) = default;
    template <typename R, typename P>
    explicit constexpr Duration(const std::chrono::duration<R, P>& src)
        : value_{std::chrono::duration_cast<Value>(src)}
    { }
    constexpr Rep count() const { return value_.count(); }
    template <typename T>
    constexpr T as() const { return std::chrono::duration_cast<T>(value_); }
    constexpr Value get() const { return value_; }
    static constexpr Duration zero() { return Duration{Value::zero()}; }
    template <typename R, typename P>
    constexpr Duration operator+(const std::chrono::duration<R, P>& shift) const
    {
        return Duration{value_ + std::chrono::duration_cast<Value>(shift)};
    }
private:
    Value value_{};
    friend constexpr bool operator<(const Duration& lhs, const Duration& rhs) { return lhs.value_ < rhs.value_; }
    friend constexpr bool operator<=(const Duration& lhs, const Duration& rhs) { return lhs.value_ <= rhs.value_; }
    friend constexpr bool operator==(const Duration& lhs, const Duration& rhs) { return lhs.value_ == rhs.value_; }
    friend constexpr bool operator!=(const Duration& lhs, const Duration& rhs) { return lhs.value_ != rhs.value_; }
    friend constexpr bool operator>=(const Duration& lhs, const Duration& rhs) { return lhs.value_ >= rhs.value_; }
    friend constexpr bool operator>(const Duration& lhs, const Duration& rhs) { return lhs.value_ > rhs.value_; }
};

template <typename Tag>
using Seconds = Duration<std::chrono::seconds, Tag>;

template <typename Tag>
using Milliseconds = Duration<std::chrono::milliseconds, Tag>;

template <typename Tag>
using Nanoseconds = Duration<std::chrono::nanoseconds, Tag>;

using Uptime = Nanoseconds<struct UptimeTag_>;

Uptime get_uptime();

//source of the current time; tests replace it by a manually driven one
using Clock = std::function<Uptime()>;

std::ostream& operator<<(std::ostream& out, const Uptime& uptime);

}//namespace TimeUnit

#endif//TIME_UNIT_HH_AA862C0A2A13AEFBE6D015A289BED606
