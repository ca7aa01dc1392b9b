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

#ifndef TRANSPORT_HH_7C85D5BE63ECB56E0176E62068801E57//date "+%s"|md5sum|tr "[a-f]" "[A-F]"
#define TRANSPORT_HH_7C85D5BE63ECB56E0176E62068801E57

#include <getdns/getdns.h>

#include <string>
#include <vector>


namespace GetDns {

enum class TransportProtocol
{
    udp,
    tcp,
    tls
};

using TransportsList = std::vector<TransportProtocol>;

constexpr ::getdns_transport_list_t to_transport_protocol(TransportProtocol protocol) noexcept
{
    switch (protocol)
    {
        case TransportProtocol::udp:
            return ::GETDNS_TRANSPORT_UDP;
        case TransportProtocol::tcp:
            return ::GETDNS_TRANSPORT_TCP;
        case TransportProtocol::tls:
            return ::GETDNS_TRANSPORT_TLS;
    }
    return ::GETDNS_TRANSPORT_UDP;
}

//accepts comma separated list of "udp", "tcp" and "tls", each at most once
TransportsList make_transports_list(const std::string& protocols);

}//namespace GetDns

#endif//TRANSPORT_HH_7C85D5BE63ECB56E0176E62068801E57
