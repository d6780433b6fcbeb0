// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include "pointcloud_dataset/core/SampleCache.hpp"

using pointcloud_dataset::DecodedSample;
using pointcloud_dataset::PointArray;
using pointcloud_dataset::SampleCache;

namespace {

struct CountingDecoder {
    std::size_t* calls;

    DecodedSample operator()(std::size_t index) const {
        ++(*calls);
        DecodedSample sample;
        sample.points = PointArray(2, 3, static_cast<float>(index));
        sample.label = static_cast<int32_t>(index % 2);
        return sample;
    }
};

}  // namespace

TEST(SampleCacheTest, HitReturnsStoredSample) {
    std::size_t calls = 0;
    SampleCache cache(4, CountingDecoder{&calls});

    auto first = cache.getOrDecode(1);
    auto second = cache.getOrDecode(1);

    EXPECT_EQ(1u, calls);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(1u, cache.hits());
    EXPECT_EQ(1u, cache.misses());
    EXPECT_FLOAT_EQ(1.0f, second->points.at(1, 2));
}

TEST(SampleCacheTest, StopsInsertingAtCapacityWithoutEviction) {
    std::size_t calls = 0;
    SampleCache cache(2, CountingDecoder{&calls});

    cache.getOrDecode(0);
    cache.getOrDecode(1);
    auto overflow = cache.getOrDecode(2);

    EXPECT_EQ(2u, cache.size());
    EXPECT_TRUE(cache.contains(0));
    EXPECT_TRUE(cache.contains(1));
    EXPECT_FALSE(cache.contains(2));
    EXPECT_FLOAT_EQ(2.0f, overflow->points.at(0, 0));

    // Uncached index decodes again every time
    cache.getOrDecode(2);
    EXPECT_EQ(4u, calls);
    EXPECT_EQ(2u, cache.size());
}

TEST(SampleCacheTest, ZeroCapacityNeverStores) {
    std::size_t calls = 0;
    SampleCache cache(0, CountingDecoder{&calls});

    cache.getOrDecode(0);
    cache.getOrDecode(0);

    EXPECT_EQ(0u, cache.size());
    EXPECT_EQ(2u, calls);
    EXPECT_EQ(0u, cache.capacity());
}

TEST(SampleCacheTest, DecoderFailurePropagatesAndCachesNothing) {
    SampleCache cache(4, [](std::size_t) -> DecodedSample {
        throw std::runtime_error("corrupt sample");
    });

    EXPECT_THROW(cache.getOrDecode(3), std::runtime_error);
    EXPECT_EQ(0u, cache.size());
}

TEST(SampleCacheTest, ConcurrentCallersRespectCapacity) {
    SampleCache cache(8, [](std::size_t index) {
        DecodedSample sample;
        sample.points = PointArray(1, 3, static_cast<float>(index));
        return sample;
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t]() {
            for (std::size_t i = 0; i < 64; ++i) {
                cache.getOrDecode((i * 7 + static_cast<std::size_t>(t)) % 32);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(8u, cache.size());
}
