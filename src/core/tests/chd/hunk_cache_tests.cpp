#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>
#include "../../chd/hunk_cache.hpp"
#include "../../errors.hpp"

static Hunk_Cache::Decode_Fn fill_with(uint8_t value, int* calls = nullptr)
{
    return [value, calls](uint8_t* dest)
    {
        memset(dest, value, 16);
        if (calls)
            (*calls)++;
    };
}

TEST(HunkCache, KeepsMostRecentlyUsed)
{
    Hunk_Cache cache(2, 16, false);
    cache.fetch(1, fill_with(1));
    cache.fetch(2, fill_with(2));

    //touching 1 makes 2 the oldest
    int calls = 0;
    EXPECT_EQ(1, (*cache.fetch(1, fill_with(9, &calls)))[0]);
    EXPECT_EQ(0, calls);
    cache.fetch(3, fill_with(3));

    EXPECT_TRUE(cache.contains(1));
    EXPECT_FALSE(cache.contains(2));
    EXPECT_TRUE(cache.contains(3));
    EXPECT_EQ(2u, cache.resident());
}

TEST(HunkCache, HugeCapacityAllocatesOnDemand)
{
    Hunk_Cache cache(0xFFFFFFFF, 16, true);
    cache.fetch(7, fill_with(7));
    EXPECT_EQ(1u, cache.resident());
    EXPECT_EQ(0xFFFFFFFFu, cache.capacity());
}

TEST(HunkCache, EvictsInInsertionOrderWithoutUse)
{
    Hunk_Cache cache(3, 16, true);
    for (uint32_t hunk = 0; hunk < 5; hunk++)
        cache.fetch(hunk, fill_with((uint8_t)hunk));

    EXPECT_FALSE(cache.contains(0));
    EXPECT_FALSE(cache.contains(1));
    EXPECT_TRUE(cache.contains(2));
    EXPECT_TRUE(cache.contains(3));
    EXPECT_TRUE(cache.contains(4));
}

TEST(HunkCache, HitDoesNotDecode)
{
    Hunk_Cache cache(4, 16, true);
    int calls = 0;
    Hunk_Buffer first = cache.fetch(7, fill_with(0x77, &calls));
    Hunk_Buffer second = cache.fetch(7, fill_with(0x00, &calls));

    EXPECT_EQ(1, calls);
    EXPECT_EQ(first, second);
    EXPECT_EQ(0x77, (*second)[15]);
}

TEST(HunkCache, ZeroCapacityPassesThrough)
{
    Hunk_Cache cache(0, 16, true);
    int calls = 0;
    cache.fetch(1, fill_with(1, &calls));
    cache.fetch(1, fill_with(1, &calls));

    EXPECT_EQ(2, calls);
    EXPECT_EQ(0u, cache.resident());
    EXPECT_FALSE(cache.contains(1));
}

TEST(HunkCache, FailedDecodeIsNotCached)
{
    Hunk_Cache cache(4, 16, true);
    EXPECT_THROW(cache.fetch(3, [](uint8_t*) { throw Codec_error("bad data"); }), Codec_error);
    EXPECT_FALSE(cache.contains(3));

    //the next caller gets a fresh attempt
    int calls = 0;
    Hunk_Buffer buffer = cache.fetch(3, fill_with(3, &calls));
    EXPECT_EQ(1, calls);
    EXPECT_EQ(3, (*buffer)[0]);
}

TEST(HunkCache, ClearDropsEverything)
{
    Hunk_Cache cache(4, 16, false);
    cache.fetch(1, fill_with(1));
    cache.fetch(2, fill_with(2));
    cache.clear();
    EXPECT_EQ(0u, cache.resident());
    EXPECT_FALSE(cache.contains(1));
}

TEST(HunkCache, ConcurrentMissesDecodeOnce)
{
    Hunk_Cache cache(4, 16, true);
    std::atomic<int> decodes(0);
    std::atomic<bool> go(false);

    auto decode = [&decodes](uint8_t* dest)
    {
        decodes++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        memset(dest, 0x42, 16);
    };

    std::vector<Hunk_Buffer> results(8);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++)
    {
        threads.emplace_back([&, i]()
        {
            while (!go)
                std::this_thread::yield();
            results[i] = cache.fetch(5, decode);
        });
    }
    go = true;
    for (std::thread& t : threads)
        t.join();

    EXPECT_EQ(1, decodes.load());
    for (const Hunk_Buffer& result : results)
    {
        ASSERT_NE(nullptr, result);
        EXPECT_EQ(std::vector<uint8_t>(16, 0x42), *result);
    }
}

TEST(HunkCache, WaitersSeeTheDecodeFailure)
{
    Hunk_Cache cache(4, 16, true);
    std::atomic<int> decodes(0);
    std::atomic<int> failures(0);
    std::atomic<bool> go(false);

    auto decode = [&decodes](uint8_t*)
    {
        decodes++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        throw Codec_error("hunk 9: corrupt stream");
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++)
    {
        threads.emplace_back([&]()
        {
            while (!go)
                std::this_thread::yield();
            try
            {
                cache.fetch(9, decode);
            }
            catch (Codec_error&)
            {
                failures++;
            }
        });
    }
    go = true;
    for (std::thread& t : threads)
        t.join();

    //threads that arrive after the failure start their own attempt, so only the totals line up
    EXPECT_GE(decodes.load(), 1);
    EXPECT_EQ(4, failures.load());
    EXPECT_FALSE(cache.contains(9));
}
