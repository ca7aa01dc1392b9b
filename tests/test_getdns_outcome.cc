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

#include "src/getdns/address_resolver.hh"
#include "src/getdns/data.hh"
#include "src/getdns/transport.hh"

#include <boost/optional/optional_io.hpp>

#include <getdns/getdns.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

using LookupCache::ErrorCode;

GetDns::Data::Dict make_record(std::uint32_t type, std::uint32_t ttl, const char* rdata_key, const std::vector<std::uint8_t>& rdata)
{
    const GetDns::Data::BinData raw{rdata.data(), rdata.size()};
    GetDns::Data::Dict rdata_dict{::getdns_dict_create()};
    rdata_dict.set(rdata_key, *raw);
    GetDns::Data::Dict record{::getdns_dict_create()};
    record.set("type", type)
          .set("class", static_cast<std::uint32_t>(GETDNS_RRCLASS_IN))
          .set("ttl", ttl)
          .set("rdata", *rdata_dict);
    return record;
}

GetDns::Data::Dict make_response(std::uint32_t status, std::uint32_t rcode, const std::vector<const GetDns::Data::Dict*>& records)
{
    GetDns::Data::List answer{::getdns_list_create()};
    for (const auto* record : records)
    {
        answer.push_back(**record);
    }
    GetDns::Data::Dict header{::getdns_dict_create()};
    header.set("rcode", rcode);
    GetDns::Data::Dict reply{::getdns_dict_create()};
    reply.set("header", *header)
         .set("answer", *answer);
    GetDns::Data::List replies_tree{::getdns_list_create()};
    replies_tree.push_back(*reply);
    GetDns::Data::Dict response{::getdns_dict_create()};
    response.set("status", status)
            .set("replies_tree", *replies_tree);
    return response;
}

TEST(GetDnsOutcome, callback_type_decides_first)
{
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_CANCEL, boost::none, boost::none, false), ErrorCode::cancelled);
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_TIMEOUT, boost::none, boost::none, false), ErrorCode::timeout);
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_ERROR, boost::none, boost::none, false), ErrorCode::server_failure);
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_TIMEOUT, std::uint32_t{GETDNS_RESPSTATUS_GOOD}, std::uint32_t{GETDNS_RCODE_NOERROR}, true), ErrorCode::timeout);
}

TEST(GetDnsOutcome, addresses_mean_success)
{
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_COMPLETE, std::uint32_t{GETDNS_RESPSTATUS_GOOD}, std::uint32_t{GETDNS_RCODE_NOERROR}, true), boost::none);
}

TEST(GetDnsOutcome, rcode_decides_without_addresses)
{
    const auto classify = [](std::uint32_t rcode)
    {
        return GetDns::classify_outcome(::GETDNS_CALLBACK_COMPLETE, std::uint32_t{GETDNS_RESPSTATUS_NO_NAME}, rcode, false);
    };
    EXPECT_EQ(classify(GETDNS_RCODE_NXDOMAIN), ErrorCode::not_found);
    EXPECT_EQ(classify(GETDNS_RCODE_SERVFAIL), ErrorCode::server_failure);
    EXPECT_EQ(classify(GETDNS_RCODE_REFUSED), ErrorCode::refused);
    EXPECT_EQ(classify(GETDNS_RCODE_FORMERR), ErrorCode::format_error);
    EXPECT_EQ(classify(GETDNS_RCODE_NOTIMP), ErrorCode::not_implemented);
    EXPECT_EQ(classify(GETDNS_RCODE_NOERROR), ErrorCode::no_data);
}

TEST(GetDnsOutcome, status_decides_without_rcode)
{
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_COMPLETE, std::uint32_t{GETDNS_RESPSTATUS_ALL_TIMEOUT}, boost::none, false), ErrorCode::timeout);
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_COMPLETE, std::uint32_t{GETDNS_RESPSTATUS_ALL_BOGUS_ANSWERS}, boost::none, false), ErrorCode::server_failure);
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_COMPLETE, std::uint32_t{GETDNS_RESPSTATUS_NO_NAME}, boost::none, false), ErrorCode::no_data);
    EXPECT_EQ(GetDns::classify_outcome(::GETDNS_CALLBACK_COMPLETE, boost::none, boost::none, false), ErrorCode::no_data);
}

TEST(GetDnsOutcome, ipv4_addresses_with_ttl_are_collected)
{
    const auto first = make_record(GETDNS_RRTYPE_A, 300, "ipv4_address", {192, 0, 2, 1});
    const auto second = make_record(GETDNS_RRTYPE_A, 60, "ipv4_address", {192, 0, 2, 2});
    const auto response = make_response(GETDNS_RESPSTATUS_GOOD, GETDNS_RCODE_NOERROR, {&first, &second});
    const auto parsed = GetDns::parse_response(*response, LookupCache::Family::ipv4, true);
    EXPECT_EQ(parsed.status, std::uint32_t{GETDNS_RESPSTATUS_GOOD});
    EXPECT_EQ(parsed.rcode, std::uint32_t{GETDNS_RCODE_NOERROR});
    ASSERT_EQ(parsed.addresses.size(), 2u);
    EXPECT_EQ(parsed.addresses[0].address, boost::asio::ip::make_address("192.0.2.1"));
    EXPECT_EQ(parsed.addresses[0].ttl.count(), 300);
    EXPECT_EQ(parsed.addresses[1].address, boost::asio::ip::make_address("192.0.2.2"));
    EXPECT_EQ(parsed.addresses[1].ttl.count(), 60);
}

TEST(GetDnsOutcome, records_of_other_type_are_skipped)
{
    const auto alias = make_record(GETDNS_RRTYPE_CNAME, 300, "cname", {0});
    const auto address = make_record(GETDNS_RRTYPE_AAAA, 120, "ipv6_address", {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});
    const auto response = make_response(GETDNS_RESPSTATUS_GOOD, GETDNS_RCODE_NOERROR, {&alias, &address});
    const auto parsed = GetDns::parse_response(*response, LookupCache::Family::ipv6, false);
    ASSERT_EQ(parsed.addresses.size(), 1u);
    EXPECT_EQ(parsed.addresses[0].address, boost::asio::ip::make_address("2001:db8::1"));
    EXPECT_EQ(parsed.addresses[0].ttl.count(), 0);
}

TEST(GetDnsOutcome, malformed_record_is_skipped)
{
    const auto broken = make_record(GETDNS_RRTYPE_A, 300, "ipv4_address", {192, 0, 2});
    const auto valid = make_record(GETDNS_RRTYPE_A, 300, "ipv4_address", {192, 0, 2, 7});
    const auto response = make_response(GETDNS_RESPSTATUS_GOOD, GETDNS_RCODE_NOERROR, {&broken, &valid});
    const auto parsed = GetDns::parse_response(*response, LookupCache::Family::ipv4, true);
    ASSERT_EQ(parsed.addresses.size(), 1u);
    EXPECT_EQ(parsed.addresses[0].address, boost::asio::ip::make_address("192.0.2.7"));
}

TEST(GetDnsOutcome, response_without_replies)
{
    GetDns::Data::Dict response{::getdns_dict_create()};
    response.set("status", static_cast<std::uint32_t>(GETDNS_RESPSTATUS_ALL_TIMEOUT));
    const auto parsed = GetDns::parse_response(*response, LookupCache::Family::ipv4, true);
    EXPECT_EQ(parsed.status, std::uint32_t{GETDNS_RESPSTATUS_ALL_TIMEOUT});
    EXPECT_EQ(parsed.rcode, boost::none);
    EXPECT_TRUE(parsed.addresses.empty());
}

TEST(GetDnsOutcome, syscall_names)
{
    EXPECT_STREQ(GetDns::get_syscall_name(LookupCache::Family::ipv4), "queryA");
    EXPECT_STREQ(GetDns::get_syscall_name(LookupCache::Family::ipv6), "queryAaaa");
}

TEST(GetDnsTransport, transports_list_is_parsed)
{
    EXPECT_EQ(GetDns::make_transports_list("tls,tcp"),
              (GetDns::TransportsList{GetDns::TransportProtocol::tls, GetDns::TransportProtocol::tcp}));
    EXPECT_EQ(GetDns::make_transports_list("udp"), GetDns::TransportsList{GetDns::TransportProtocol::udp});
    EXPECT_THROW(GetDns::make_transports_list("udp,udp"), std::invalid_argument);
    EXPECT_THROW(GetDns::make_transports_list("quic"), std::invalid_argument);
}

}//namespace {anonymous}
