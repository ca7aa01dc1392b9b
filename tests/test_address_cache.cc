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

#include "src/lookup_cache/address_cache.hh"

#include "tests/fake_resolver.hh"

#include <gtest/gtest.h>

#include <chrono>

namespace {

using LookupCache::Family;
using LookupCache::make_key;

class AddressCacheTest : public ::testing::Test
{
protected:
    AddressCacheTest()
        : cache{clock.get_clock()}
    { }
    LookupCache::ResolvedAddresses make_addresses(std::initializer_list<LookupCache::RawAddress> raw)
    {
        LookupCache::ResolvedAddresses result;
        for (const auto& address : raw)
        {
            result.push_back(LookupCache::make_resolved_address(address, Family::ipv4, clock.now()));
        }
        return result;
    }
    LookupCacheTest::ManualClock clock;
    LookupCache::AddressCache cache;
};

TEST_F(AddressCacheTest, empty_cache_has_nothing)
{
    const auto key = make_key("example.com", Family::ipv4);
    EXPECT_FALSE(cache.has(key));
    EXPECT_EQ(cache.get(key), nullptr);
}

TEST_F(AddressCacheTest, stored_addresses_are_available_until_expiry)
{
    const auto key = make_key("example.com", Family::ipv4);
    cache.put(key, make_addresses({LookupCacheTest::make_raw_address("192.0.2.1", 10)}));
    ASSERT_TRUE(cache.has(key));
    EXPECT_FALSE(cache.has(make_key("example.com", Family::ipv6)));
    clock.advance(std::chrono::seconds{10});
    EXPECT_TRUE(cache.has(key));
    clock.advance(std::chrono::milliseconds{1});
    EXPECT_FALSE(cache.has(key));
    EXPECT_EQ(cache.get(key), nullptr);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(AddressCacheTest, entry_expires_with_its_shortest_living_address)
{
    const auto key = make_key("example.com", Family::ipv4);
    cache.put(key, make_addresses({LookupCacheTest::make_raw_address("192.0.2.1", 100), LookupCacheTest::make_raw_address("192.0.2.2", 1)}));
    clock.advance(std::chrono::seconds{2});
    EXPECT_FALSE(cache.has(key));
}

TEST_F(AddressCacheTest, put_replaces_previous_entry)
{
    const auto key = make_key("example.com", Family::ipv4);
    cache.put(key, make_addresses({LookupCacheTest::make_raw_address("192.0.2.1", 10)}));
    cache.put(key, make_addresses({LookupCacheTest::make_raw_address("192.0.2.2", 10), LookupCacheTest::make_raw_address("192.0.2.3", 10)}));
    const auto entry = cache.get(key);
    ASSERT_NE(entry, nullptr);
    ASSERT_EQ(entry->get_addresses().size(), 2u);
    EXPECT_EQ(entry->get_addresses()[0].address, LookupCacheTest::ip("192.0.2.2"));
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(AddressCacheTest, stored_entry_is_a_copy)
{
    const auto key = make_key("example.com", Family::ipv4);
    auto addresses = make_addresses({LookupCacheTest::make_raw_address("192.0.2.1", 10)});
    cache.put(key, addresses);
    addresses.front().address = LookupCacheTest::ip("192.0.2.99");
    EXPECT_EQ(cache.get(key)->get_addresses().front().address, LookupCacheTest::ip("192.0.2.1"));
}

TEST_F(AddressCacheTest, empty_list_is_not_cached)
{
    const auto key = make_key("example.com", Family::ipv4);
    cache.put(key, make_addresses({LookupCacheTest::make_raw_address("192.0.2.1", 10)}));
    const auto entry = cache.put(key, LookupCache::ResolvedAddresses{});
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->empty());
    EXPECT_FALSE(cache.has(key));
}

TEST_F(AddressCacheTest, entry_cycles_through_addresses)
{
    LookupCache::CacheEntry entry{make_addresses({LookupCacheTest::make_raw_address("192.0.2.1", 10), LookupCacheTest::make_raw_address("192.0.2.2", 10)})};
    EXPECT_EQ(entry.get_next_address().address, LookupCacheTest::ip("192.0.2.1"));
    EXPECT_EQ(entry.get_next_address().address, LookupCacheTest::ip("192.0.2.2"));
    EXPECT_EQ(entry.get_next_address().address, LookupCacheTest::ip("192.0.2.1"));
}

TEST_F(AddressCacheTest, expiry_is_stamped_from_ttl)
{
    const auto resolved = LookupCache::make_resolved_address(LookupCacheTest::make_raw_address("2001:db8::1", 30), Family::ipv6, clock.now());
    EXPECT_EQ(resolved.family, Family::ipv6);
    EXPECT_EQ(resolved.ttl.count(), 30);
    EXPECT_EQ(resolved.expires_at, clock.now() + std::chrono::seconds{30});
}

}//namespace {anonymous}
