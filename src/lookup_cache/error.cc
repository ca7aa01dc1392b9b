/*
 * Copyright (C) 2026  CZ.NIC, z. s. p. o.
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

#include "src/lookup_cache/error.hh"

#include <iostream>
#include <utility>


namespace LookupCache {

namespace {

std::string make_message(ErrorCode code, const std::string& hostname, const boost::optional<std::string>& syscall)
{
    std::string msg = std::string{to_code_name(code)} + " " + hostname;
    if (syscall != boost::none)
    {
        msg = *syscall + " " + msg;
    }
    return msg;
}

}//namespace LookupCache::{anonymous}

InvalidArgument::InvalidArgument(std::string msg)
    : msg_{std::move(msg)}
{ }

const char* InvalidArgument::what() const noexcept
{
    return msg_.c_str();
}

const char* to_code_name(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::no_data:
            return "ENODATA";
        case ErrorCode::not_found:
            return "ENOTFOUND";
        case ErrorCode::timeout:
            return "ETIMEOUT";
        case ErrorCode::server_failure:
            return "ESERVFAIL";
        case ErrorCode::refused:
            return "EREFUSED";
        case ErrorCode::format_error:
            return "EFORMERR";
        case ErrorCode::not_implemented:
            return "ENOTIMP";
        case ErrorCode::cancelled:
            return "ECANCELLED";
        case ErrorCode::bad_name:
            return "EBADNAME";
    }
    return "EUNKNOWN";
}

std::ostream& operator<<(std::ostream& out, ErrorCode code)
{
    return out << to_code_name(code);
}

Error::Error(
        ErrorCode code,
        std::string hostname,
        boost::optional<std::string> syscall)
    : code_{code},
      hostname_{std::move(hostname)},
      syscall_{std::move(syscall)},
      msg_{make_message(code_, hostname_, syscall_)}
{ }

const char* Error::what() const noexcept
{
    return msg_.c_str();
}

ErrorCode Error::get_code() const noexcept
{
    return code_;
}

const char* Error::get_code_name() const noexcept
{
    return to_code_name(code_);
}

const char* Error::get_errno_name() const noexcept
{
    return to_code_name(code_);
}

const std::string& Error::get_hostname() const noexcept
{
    return hostname_;
}

const boost::optional<std::string>& Error::get_syscall() const noexcept
{
    return syscall_;
}

ErrorPtr make_error(
        ErrorCode code,
        const std::string& hostname,
        const boost::optional<std::string>& syscall)
{
    return std::make_shared<const Error>(code, hostname, syscall);
}

ErrorPtr make_not_found_error(
        const std::string& hostname,
        const boost::optional<std::string>& syscall)
{
    return make_error(ErrorCode::not_found, hostname, syscall);
}

}//namespace LookupCache
