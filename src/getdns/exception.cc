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

#include "src/getdns/exception.hh"

#include <getdns/getdns_extra.h>

#include <cstdint>
#include <iostream>
#include <sstream>
#include <utility>

namespace GetDns {

namespace {

std::string get_description(::getdns_return_t result)
{
    const char* const description = ::getdns_get_errorstr_by_id(static_cast<std::uint16_t>(result));
    if (description != nullptr)
    {
        return description;
    }
    return "unknown GetDns return value " + std::to_string(result);
}

template <typename E>
[[noreturn]] void raise(::getdns_return_t result, const char* file, int line)
{
    E error{result, get_description(result)};
    std::ostringstream out;
    out << "at " << file << ":" << line << " occurred: " << error.what() << std::endl;
    std::cerr << out.str();
    throw error;
}

}//namespace GetDns::{anonymous}

Exception::Exception(::getdns_return_t return_code, std::string msg)
    : return_code_{return_code},
      msg_{std::move(msg)}
{ }

const char* Exception::what() const noexcept
{
    return msg_.c_str();
}

::getdns_return_t Exception::get_return_code() const noexcept
{
    return return_code_;
}

void success_required(::getdns_return_t result, const char* file, int line)
{
    switch (static_cast<int>(result))
    {
        case GETDNS_RETURN_GOOD:
            return;
        case GETDNS_RETURN_GENERIC_ERROR:
            raise<GenericError>(result, file, line);
        case GETDNS_RETURN_BAD_DOMAIN_NAME:
            raise<BadDomainName>(result, file, line);
        case GETDNS_RETURN_BAD_CONTEXT:
            raise<BadContext>(result, file, line);
        case GETDNS_RETURN_CONTEXT_UPDATE_FAIL:
            raise<ContextUpdateFail>(result, file, line);
        case GETDNS_RETURN_UNKNOWN_TRANSACTION:
            raise<UnknownTransaction>(result, file, line);
        case GETDNS_RETURN_NO_SUCH_LIST_ITEM:
            raise<NoSuchListItem>(result, file, line);
        case GETDNS_RETURN_NO_SUCH_DICT_NAME:
            raise<NoSuchDictName>(result, file, line);
        case GETDNS_RETURN_WRONG_TYPE_REQUESTED:
            raise<WrongTypeRequested>(result, file, line);
        case GETDNS_RETURN_MEMORY_ERROR:
            raise<MemoryError>(result, file, line);
        case GETDNS_RETURN_INVALID_PARAMETER:
            raise<InvalidParameter>(result, file, line);
        case GETDNS_RETURN_NOT_IMPLEMENTED:
            raise<NotImplemented>(result, file, line);
        case GETDNS_RETURN_IO_ERROR:
            raise<IoError>(result, file, line);
        case GETDNS_RETURN_NO_UPSTREAM_AVAILABLE:
            raise<NoUpstreamAvailable>(result, file, line);
        case GETDNS_RETURN_NEED_MORE_SPACE:
            raise<NeedMoreSpace>(result, file, line);
    }
    raise<UnknownGetDnsErrorCode>(result, file, line);
}

}//namespace GetDns
