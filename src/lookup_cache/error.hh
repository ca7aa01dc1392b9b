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

#ifndef ERROR_HH_10BF4EBD27D490225A22B8C954ACAE45//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define ERROR_HH_10BF4EBD27D490225A22B8C954ACAE45

#include <boost/optional.hpp>

#include <exception>
#include <iosfwd>
#include <memory>
#include <string>


namespace LookupCache {

struct Exception : std::exception { };

//malformed call arguments, always thrown before any asynchronous work starts
class InvalidArgument : public Exception
{
public:
    explicit InvalidArgument(std::string msg);
    const char* what() const noexcept override;
private:
    std::string msg_;
};

enum class ErrorCode
{
    no_data,
    not_found,
    timeout,
    server_failure,
    refused,
    format_error,
    not_implemented,
    cancelled,
    bad_name
};

const char* to_code_name(ErrorCode code) noexcept;

std::ostream& operator<<(std::ostream& out, ErrorCode code);

/**
 * Outcome of a failed resolution.
 *
 * Errors are shared by pointer, every caller waiting for the same resolution
 * receives the same instance.
 */
class Error : public std::exception
{
public:
    Error(ErrorCode code,
          std::string hostname,
          boost::optional<std::string> syscall);
    const char* what() const noexcept override;
    ErrorCode get_code() const noexcept;
    const char* get_code_name() const noexcept;
    const char* get_errno_name() const noexcept;
    const std::string& get_hostname() const noexcept;
    const boost::optional<std::string>& get_syscall() const noexcept;
private:
    ErrorCode code_;
    std::string hostname_;
    boost::optional<std::string> syscall_;
    std::string msg_;
};

using ErrorPtr = std::shared_ptr<const Error>;

ErrorPtr make_error(
        ErrorCode code,
        const std::string& hostname,
        const boost::optional<std::string>& syscall = boost::none);

ErrorPtr make_not_found_error(
        const std::string& hostname,
        const boost::optional<std::string>& syscall = boost::none);

}//namespace LookupCache

#endif//ERROR_HH_10BF4EBD27D490225A22B8C954ACAE45
