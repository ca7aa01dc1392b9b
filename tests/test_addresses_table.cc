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

#include "src/lookup_cache/addresses_table.hh"

#include "tests/fake_resolver.hh"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace {

using LookupCache::Family;

struct Answer
{
    LookupCache::ErrorPtr error;
    LookupCache::ResolvedAddresses addresses;
};

class AddressesTableTest : public ::testing::Test
{
protected:
    AddressesTableTest()
        : table{Family::ipv4, resolver, event_base, clock.get_clock()}
    { }
    void resolve(const std::string& hostname, bool all)
    {
        table.resolve(hostname, all, [this](const LookupCache::ErrorPtr& error, const LookupCache::ResolvedAddresses& addresses)
        {
            answers.push_back(Answer{error, addresses});
        });
    }
    Event::Base event_base;
    LookupCacheTest::FakeResolver resolver;
    LookupCacheTest::ManualClock clock;
    LookupCache::AddressesTable table;
    std::vector<Answer> answers;
};

TEST_F(AddressesTableTest, concurrent_requests_share_one_resolution)
{
    resolve("example.com", true);
    resolve("example.com", true);
    resolve("example.com", false);
    EXPECT_EQ(resolver.get_number_of_calls(), 1u);
    EXPECT_EQ(table.get_tasks().size(), 1u);
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60), LookupCacheTest::make_raw_address("192.0.2.2", 60)});
    ASSERT_EQ(answers.size(), 3u);
    EXPECT_EQ(answers[0].addresses.size(), 2u);
    EXPECT_EQ(answers[1].addresses.size(), 2u);
    ASSERT_EQ(answers[2].addresses.size(), 1u);
    EXPECT_EQ(table.get_tasks().size(), 0u);
    EXPECT_TRUE(table.get_cache().has(LookupCache::make_key("example.com", Family::ipv4)));
}

TEST_F(AddressesTableTest, cached_answer_is_never_delivered_synchronously)
{
    resolve("example.com", true);
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    answers.clear();
    resolve("example.com", true);
    EXPECT_TRUE(answers.empty());
    LookupCacheTest::run_deferred(event_base);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].error, nullptr);
    EXPECT_EQ(resolver.get_number_of_calls(), 1u);
}

TEST_F(AddressesTableTest, single_address_requests_rotate)
{
    resolve("example.com", true);
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60), LookupCacheTest::make_raw_address("192.0.2.2", 60)});
    answers.clear();
    resolve("example.com", false);
    resolve("example.com", false);
    resolve("example.com", false);
    LookupCacheTest::run_deferred(event_base);
    ASSERT_EQ(answers.size(), 3u);
    EXPECT_EQ(answers[0].addresses.at(0).address, LookupCacheTest::ip("192.0.2.1"));
    EXPECT_EQ(answers[1].addresses.at(0).address, LookupCacheTest::ip("192.0.2.2"));
    EXPECT_EQ(answers[2].addresses.at(0).address, LookupCacheTest::ip("192.0.2.1"));
}

TEST_F(AddressesTableTest, expired_entry_starts_new_resolution)
{
    resolve("example.com", true);
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 30)});
    clock.advance(std::chrono::seconds{30});
    resolve("example.com", true);
    EXPECT_EQ(resolver.get_number_of_calls(), 1u);
    clock.advance(std::chrono::milliseconds{1});
    resolve("example.com", true);
    EXPECT_EQ(resolver.get_number_of_calls(), 2u);
}

TEST_F(AddressesTableTest, errors_pass_through_unchanged)
{
    resolve("example.com", false);
    resolve("example.com", false);
    const auto error = LookupCache::make_error(LookupCache::ErrorCode::no_data, "example.com", std::string{"queryA"});
    resolver.fail(Family::ipv4, "example.com", error);
    ASSERT_EQ(answers.size(), 2u);
    EXPECT_EQ(answers[0].error, error);
    EXPECT_EQ(answers[1].error, error);
    EXPECT_FALSE(table.get_cache().has(LookupCache::make_key("example.com", Family::ipv4)));
    resolve("example.com", false);
    EXPECT_EQ(resolver.get_number_of_calls(), 2u);
}

TEST_F(AddressesTableTest, request_from_failure_callback_starts_new_resolution)
{
    table.resolve("example.com", false, [this](const LookupCache::ErrorPtr& error, const LookupCache::ResolvedAddresses&)
    {
        answers.push_back(Answer{error, {}});
        resolve("example.com", false);
    });
    resolver.fail(Family::ipv4, "example.com", LookupCache::make_error(LookupCache::ErrorCode::timeout, "example.com"));
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(resolver.get_number_of_calls(), 2u);
    EXPECT_EQ(table.get_tasks().size(), 1u);
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    ASSERT_EQ(answers.size(), 2u);
    EXPECT_EQ(answers[1].error, nullptr);
}

TEST_F(AddressesTableTest, request_from_success_callback_is_served_from_cache)
{
    table.resolve("example.com", false, [this](const LookupCache::ErrorPtr& error, const LookupCache::ResolvedAddresses& addresses)
    {
        answers.push_back(Answer{error, addresses});
        resolve("example.com", false);
    });
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    LookupCacheTest::run_deferred(event_base);
    EXPECT_EQ(answers.size(), 2u);
    EXPECT_EQ(resolver.get_number_of_calls(), 1u);
}

}//namespace {anonymous}
