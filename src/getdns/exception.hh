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

#ifndef EXCEPTION_HH_0030927EE255A372CE05363BB615578A//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define EXCEPTION_HH_0030927EE255A372CE05363BB615578A

#include <getdns/getdns.h>

#include <exception>
#include <string>

namespace GetDns {

class Exception : public std::exception
{
public:
    Exception(::getdns_return_t return_code, std::string msg);
    const char* what() const noexcept override;
    ::getdns_return_t get_return_code() const noexcept;
private:
    ::getdns_return_t return_code_;
    std::string msg_;
};

struct GenericError : Exception { using Exception::Exception; };
struct BadDomainName : Exception { using Exception::Exception; };
struct BadContext : Exception { using Exception::Exception; };
struct ContextUpdateFail : Exception { using Exception::Exception; };
struct UnknownTransaction : Exception { using Exception::Exception; };
struct NoSuchListItem : Exception { using Exception::Exception; };
struct NoSuchDictName : Exception { using Exception::Exception; };
struct WrongTypeRequested : Exception { using Exception::Exception; };
struct MemoryError : Exception { using Exception::Exception; };
struct InvalidParameter : Exception { using Exception::Exception; };
struct NotImplemented : Exception { using Exception::Exception; };
struct IoError : Exception { using Exception::Exception; };
struct NoUpstreamAvailable : Exception { using Exception::Exception; };
struct NeedMoreSpace : Exception { using Exception::Exception; };
struct UnknownGetDnsErrorCode : Exception { using Exception::Exception; };

//throws exception corresponding to `result` unless it is GETDNS_RETURN_GOOD
void success_required(::getdns_return_t result, const char* file, int line);

#define MUST_BE_GOOD(RESULT) ::GetDns::success_required(RESULT, __FILE__, __LINE__)

}//namespace GetDns

#endif//EXCEPTION_HH_0030927EE255A372CE05363BB615578A
