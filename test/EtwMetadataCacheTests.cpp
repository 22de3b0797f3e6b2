// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <gtest/gtest.h>
#include "EtwMetadataTestSource.h"
#include <thread>

using namespace EtwMetaTest;

namespace
{
    char const* const ProviderText = "{22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716}";

    class CacheTest : public ::testing::Test
    {
    protected:

        CacheTest()
            : provider(MakeGuid(ProviderText))
            , cache(source)
        {
            source.Providers = BuildProviderBuffer({
                { provider, 0, u"My-Provider" },
            });

            TestEvent event;
            event.Descriptor = MakeDescriptor(1, 0);
            event.EventName = u"Start";
            source.AddEvent(provider, event);
            source.SetEventList(provider, { event.Descriptor });
        }

        EtwGuid const provider;
        FakeMetadataSource source;
        EtwMetadataCache cache;
    };
}

TEST_F(CacheTest, ProvidersQueriedOnce)
{
    auto first = cache.GetProviders();
    auto second = cache.GetProviders();

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.Value, second.Value);
    ASSERT_EQ(1u, first.Value->size());
    EXPECT_EQ("My-Provider", first.Value->at(0).Name);
    EXPECT_EQ(1u, source.ProviderQueries.load());
}

TEST_F(CacheTest, ConcurrentCallersShareOneComputation)
{
    source.SizeQueryDelay = std::chrono::milliseconds(50);

    std::vector<EtwProvidersResult> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i != results.size(); i += 1)
    {
        threads.emplace_back([this, &results, i]()
        {
            results[i] = cache.GetProviders();
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(1u, source.ProviderQueries.load());
    for (auto const& result : results)
    {
        ASSERT_TRUE(result);
        EXPECT_EQ(results[0].Value, result.Value);
    }
}

TEST_F(CacheTest, ConcurrentEventLookupsShareOneComputation)
{
    source.SizeQueryDelay = std::chrono::milliseconds(20);

    std::vector<EtwEventsResult> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i != results.size(); i += 1)
    {
        threads.emplace_back([this, &results, i]()
        {
            results[i] = cache.GetProviderEvents(ProviderText);
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(1u, source.EventListQueries.load());
    EXPECT_EQ(1u, source.EventInfoQueries.load());
    for (auto const& result : results)
    {
        ASSERT_TRUE(result);
        EXPECT_EQ(results[0].Value, result.Value);
    }
}

TEST_F(CacheTest, GuidSpellingsShareOneEntry)
{
    auto braced = cache.GetProviderEvents("{22FB2CD6-0E7B-422B-A0C7-2FAD1FD0E716}");
    auto bare = cache.GetProviderEvents("22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716");

    ASSERT_TRUE(braced);
    ASSERT_TRUE(bare);
    EXPECT_EQ(braced.Value, bare.Value);
    EXPECT_EQ(1u, cache.ProviderEventsEntryCount());
    EXPECT_EQ(1u, source.EventListQueries.load());
    EXPECT_EQ(ProviderText, braced.Value->at(0).ProviderGuid);
}

TEST_F(CacheTest, FailuresAreCached)
{
    char const* const unknown = "{a0c1853b-5c40-4b15-8766-3cf1c58f985a}";

    auto first = cache.GetProviderEvents(unknown);
    auto second = cache.GetProviderEvents(unknown);

    ASSERT_FALSE(first);
    ASSERT_FALSE(second);
    EXPECT_EQ(first.Error, second.Error);
    EXPECT_EQ(EtwMetaError_SizeQueryFailed, first.Error->Error);
    EXPECT_EQ(unknown, first.Error->ProviderGuid);
    EXPECT_EQ(1u, source.EventListQueries.load());
}

TEST_F(CacheTest, ProviderFailureIsCached)
{
    source.FillStatus = 1168;

    auto first = cache.GetProviders();
    source.FillStatus = EtwMetaStatus_Success;
    auto second = cache.GetProviders();

    ASSERT_FALSE(first);
    EXPECT_EQ(first.Error, second.Error);
    EXPECT_EQ(EtwMetaError_FillFailed, second.Error->Error);
    EXPECT_EQ(1u, source.ProviderQueries.load());
}

TEST_F(CacheTest, InvalidGuidIsNotCached)
{
    auto result = cache.GetProviderEvents("{22fb2cd6-0e7b-422b-a0c7}");

    ASSERT_FALSE(result);
    EXPECT_EQ(EtwMetaError_InvalidGuid, result.Error->Error);
    EXPECT_EQ(0u, cache.ProviderEventsEntryCount());
    EXPECT_EQ(0u, source.EventListQueries.load());
}

TEST_F(CacheTest, ProvidersAreIndependentEntries)
{
    auto known = cache.GetProviderEvents(ProviderText);
    auto unknown = cache.GetProviderEvents("a0c1853b-5c40-4b15-8766-3cf1c58f985a");

    EXPECT_TRUE(known);
    EXPECT_FALSE(unknown);
    EXPECT_EQ(2u, cache.ProviderEventsEntryCount());
}
