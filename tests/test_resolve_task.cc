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

#include "src/lookup_cache/resolve_task.hh"

#include "tests/fake_resolver.hh"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace {

using LookupCache::Family;

class RecordingObserver : public LookupCache::ResolveTask::Observer
{
public:
    LookupCache::CacheEntryPtr on_resolved(const LookupCache::HostIpKey&, const LookupCache::ResolvedAddresses& addresses) override
    {
        resolved.push_back(addresses);
        return std::make_shared<LookupCache::CacheEntry>(addresses);
    }
    void on_done(const LookupCache::HostIpKey& key) override
    {
        done.push_back(key);
    }
    std::vector<LookupCache::ResolvedAddresses> resolved;
    std::vector<LookupCache::HostIpKey> done;
};

class ResolveTaskTest : public ::testing::Test
{
protected:
    std::shared_ptr<LookupCache::ResolveTask> make_task(Family family = Family::ipv4)
    {
        return std::make_shared<LookupCache::ResolveTask>(
                LookupCache::make_key("example.com", family),
                resolver,
                clock.get_clock(),
                observer);
    }
    LookupCacheTest::FakeResolver resolver;
    LookupCacheTest::ManualClock clock;
    RecordingObserver observer;
};

TEST_F(ResolveTaskTest, launch_asks_resolver_once_with_ttl)
{
    const auto task = make_task(Family::ipv6);
    EXPECT_EQ(task->get_status(), LookupCache::ResolveTask::Status::none);
    task->launch();
    EXPECT_EQ(task->get_status(), LookupCache::ResolveTask::Status::running);
    ASSERT_EQ(resolver.get_number_of_calls(), 1u);
    EXPECT_EQ(resolver.get_calls().front().family, Family::ipv6);
    EXPECT_EQ(resolver.get_calls().front().hostname, "example.com");
    EXPECT_TRUE(resolver.get_calls().front().options.ttl);
    EXPECT_THROW(task->launch(), LookupCache::Exception);
    EXPECT_EQ(resolver.get_number_of_calls(), 1u);
}

TEST_F(ResolveTaskTest, every_callback_gets_same_entry_exactly_once)
{
    const auto task = make_task();
    std::vector<LookupCache::CacheEntryPtr> entries;
    for (int idx = 0; idx < 3; ++idx)
    {
        task->attach([&](const LookupCache::ErrorPtr& error, const LookupCache::CacheEntryPtr& entry)
        {
            EXPECT_EQ(error, nullptr);
            //cache is populated and the task is deregistered before any callback
            EXPECT_EQ(observer.resolved.size(), 1u);
            EXPECT_EQ(observer.done.size(), 1u);
            entries.push_back(entry);
        });
    }
    task->launch();
    EXPECT_TRUE(entries.empty());
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    ASSERT_EQ(entries.size(), 3u);
    ASSERT_NE(entries[0], nullptr);
    EXPECT_EQ(entries[0], entries[1]);
    EXPECT_EQ(entries[1], entries[2]);
    EXPECT_EQ(task->get_status(), LookupCache::ResolveTask::Status::completed);
    EXPECT_EQ(task->get_number_of_callbacks(), 0u);
}

TEST_F(ResolveTaskTest, addresses_are_stamped_at_completion)
{
    const auto task = make_task(Family::ipv6);
    task->launch();
    clock.advance(std::chrono::seconds{5});
    resolver.succeed(Family::ipv6, "example.com", {LookupCacheTest::make_raw_address("2001:db8::1", 60)});
    ASSERT_EQ(observer.resolved.size(), 1u);
    ASSERT_EQ(observer.resolved.front().size(), 1u);
    const auto& address = observer.resolved.front().front();
    EXPECT_EQ(address.family, Family::ipv6);
    EXPECT_EQ(address.expires_at, clock.now() + std::chrono::seconds{60});
}

TEST_F(ResolveTaskTest, error_is_passed_to_all_callbacks_without_caching)
{
    const auto task = make_task();
    std::vector<LookupCache::ErrorPtr> errors;
    for (int idx = 0; idx < 2; ++idx)
    {
        task->attach([&](const LookupCache::ErrorPtr& error, const LookupCache::CacheEntryPtr& entry)
        {
            EXPECT_EQ(entry, nullptr);
            errors.push_back(error);
        });
    }
    task->launch();
    const auto error = LookupCache::make_error(LookupCache::ErrorCode::server_failure, "example.com", std::string{"queryA"});
    resolver.fail(Family::ipv4, "example.com", error);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], error);
    EXPECT_EQ(errors[1], error);
    EXPECT_TRUE(observer.resolved.empty());
    ASSERT_EQ(observer.done.size(), 1u);
    EXPECT_EQ(observer.done.front(), LookupCache::make_key("example.com", Family::ipv4));
}

TEST_F(ResolveTaskTest, completed_task_refuses_callbacks)
{
    const auto task = make_task();
    task->launch();
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    EXPECT_THROW(task->attach([](const LookupCache::ErrorPtr&, const LookupCache::CacheEntryPtr&) { }), LookupCache::Exception);
}

TEST_F(ResolveTaskTest, throwing_callback_does_not_stop_others)
{
    const auto task = make_task();
    int calls = 0;
    task->attach([&](const LookupCache::ErrorPtr&, const LookupCache::CacheEntryPtr&)
    {
        ++calls;
        throw std::runtime_error{"callback failure"};
    });
    task->attach([&](const LookupCache::ErrorPtr&, const LookupCache::CacheEntryPtr&) { ++calls; });
    task->launch();
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    EXPECT_EQ(calls, 2);
}

TEST_F(ResolveTaskTest, answer_for_dropped_task_is_ignored)
{
    auto task = make_task();
    task->launch();
    task.reset();
    resolver.succeed(Family::ipv4, "example.com", {LookupCacheTest::make_raw_address("192.0.2.1", 60)});
    EXPECT_TRUE(observer.resolved.empty());
    EXPECT_TRUE(observer.done.empty());
}

}//namespace {anonymous}
