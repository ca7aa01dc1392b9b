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

#include "src/getdns/transport.hh"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <stdexcept>


namespace GetDns {

TransportsList make_transports_list(const std::string& protocols)
{
    std::vector<std::string> items;
    boost::algorithm::split(items, protocols, boost::algorithm::is_any_of(","));
    TransportsList result;
    for (const auto& item : items)
    {
        const auto protocol = [&]()
        {
            if (item == "udp")
            {
                return TransportProtocol::udp;
            }
            if (item == "tcp")
            {
                return TransportProtocol::tcp;
            }
            if (item == "tls")
            {
                return TransportProtocol::tls;
            }
            throw std::invalid_argument{"unknown transport protocol \"" + item + "\""};
        }();
        if (std::find(begin(result), end(result), protocol) != end(result))
        {
            throw std::invalid_argument{"transport protocol \"" + item + "\" used more than once"};
        }
        result.push_back(protocol);
    }
    return result;
}

}//namespace GetDns
