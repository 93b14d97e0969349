#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include "test_image.hpp"
#include "../../chd/bytes.hpp"
#include "../../chd/chd_file.hpp"
#include "../../chd/chd_verifier.hpp"
#include "../../chd/codecs/deflate_codec.hpp"
#include "../../errors.hpp"

namespace
{

constexpr uint32_t DELTA_CODEC = CHD_MAKE_TAG('d', 'l', 't', 'a');
constexpr uint32_t COUNTING_CODEC = CHD_MAKE_TAG('c', 'n', 't', 'z');

//Each byte is stored as the difference from the same byte of the previous hunk
class Delta_Codec : public CHD_Codec
{
    public:
        void decompress(const uint8_t* src, uint32_t src_len, uint8_t* dest, uint32_t dest_len,
                        const uint8_t* context) override
        {
            if (src_len != dest_len)
                throw Codec_error("delta: wrong input size");
            for (uint32_t i = 0; i < dest_len; i++)
                dest[i] = (uint8_t)(src[i] + (context ? context[i] : 0));
        }

        bool needs_context() const override { return true; }
};

//Deflate that counts calls and takes its time, so concurrent readers overlap
class Counting_Codec : public CHD_Codec
{
    public:
        Counting_Codec(std::atomic<int>* calls) : m_calls(calls) {}

        void decompress(const uint8_t* src, uint32_t src_len, uint8_t* dest, uint32_t dest_len,
                        const uint8_t* context) override
        {
            (*m_calls)++;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            m_inner.decompress(src, src_len, dest, dest_len, context);
        }
    private:
        std::atomic<int>* m_calls;
        Deflate_Codec m_inner;
};

std::vector<uint8_t> text_hunk(uint32_t hunk_bytes, const char* phrase)
{
    std::vector<uint8_t> data(hunk_bytes);
    size_t len = strlen(phrase);
    for (uint32_t i = 0; i < hunk_bytes; i++)
        data[i] = (uint8_t)phrase[i % len];
    return data;
}

//Compressed, raw, copied and real-deflate hunks in one v5 image
Test_Image mixed_image()
{
    Test_Image image(5, 4096);
    std::vector<uint8_t> a = pattern_hunk(4096, 1);
    std::vector<uint8_t> b = pattern_hunk(4096, 2);
    std::vector<uint8_t> c = text_hunk(4096, "the quick brown fox ");
    image.add_compressed(0, stored_deflate(a), a);
    image.add_uncompressed(b);
    image.add_self(0);
    image.add_compressed(0, libdeflate_compress_buffer(c), c);
    image.add_self(3);
    image.add_compressed(0, stored_deflate(b), b);
    return image;
}

Codec_Registry delta_registry()
{
    Codec_Registry codecs = Codec_Registry::defaults();
    codecs.add(DELTA_CODEC, "Delta", [](uint32_t)
    {
        return std::unique_ptr<CHD_Codec>(new Delta_Codec());
    });
    return codecs;
}

//count delta hunks, each one differing from the hunk before it
void add_delta_run(Test_Image& image, uint32_t hunk_bytes, uint32_t count)
{
    std::vector<uint8_t> previous(hunk_bytes);
    for (uint32_t i = 0; i < count; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(hunk_bytes, i + 10);
        std::vector<uint8_t> delta(hunk_bytes);
        for (uint32_t j = 0; j < hunk_bytes; j++)
            delta[j] = (uint8_t)(data[j] - previous[j]);
        image.add_compressed(0, delta, data);
        previous = data;
    }
}

std::unique_ptr<CHD_File> open_bytes(const std::vector<uint8_t>& bytes, const CHD_Options& options = CHD_Options())
{
    return CHD_File::open(Test_Image::source(bytes), options);
}

}

TEST(CHDFile, ReadsWholeImage)
{
    Test_Image image = mixed_image();
    std::unique_ptr<CHD_File> file = open_bytes(image.build());

    EXPECT_EQ(5u, file->version());
    EXPECT_EQ(6u, file->hunk_count());
    EXPECT_EQ(6u * 4096, file->logical_bytes());
    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));
}

TEST(CHDFile, ReadsAreRepeatableAtAnyCacheSize)
{
    Test_Image image = mixed_image();
    std::vector<uint8_t> bytes = image.build();
    std::vector<uint8_t> expected = image.logical_data();

    for (uint32_t capacity : {0u, 1u, 2u, 64u})
    {
        CHD_Options options;
        options.cache_hunks = capacity;
        std::unique_ptr<CHD_File> file = open_bytes(bytes, options);
        for (int pass = 0; pass < 3; pass++)
        {
            for (uint32_t hunk = 6; hunk-- > 0;)
            {
                std::vector<uint8_t> data = file->read((uint64_t)hunk * 4096, 4096);
                EXPECT_TRUE(std::equal(data.begin(), data.end(), expected.begin() + hunk * 4096))
                    << "hunk " << hunk << " with a cache of " << capacity;
            }
        }
        EXPECT_LE(file->cache().resident(), capacity);
    }
}

TEST(CHDFile, ReadSpanningHunks)
{
    Test_Image image = mixed_image();
    std::unique_ptr<CHD_File> file = open_bytes(image.build());
    std::vector<uint8_t> expected = image.logical_data();

    std::vector<uint8_t> data = file->read(4000, 200);
    EXPECT_EQ(std::vector<uint8_t>(expected.begin() + 4000, expected.begin() + 4200), data);

    data = file->read(4095, 4098);
    EXPECT_EQ(std::vector<uint8_t>(expected.begin() + 4095, expected.begin() + 4095 + 4098), data);
}

TEST(CHDFile, PartialLastHunk)
{
    Test_Image image(5, 4096);
    for (uint32_t i = 0; i < 3; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(4096, i);
        image.add_compressed(0, stored_deflate(data), data);
    }
    image.set_logical_bytes(2 * 4096 + 100);
    std::unique_ptr<CHD_File> file = open_bytes(image.build());
    std::vector<uint8_t> expected = image.logical_data();

    EXPECT_EQ(3u, file->hunk_count());
    EXPECT_EQ(std::vector<uint8_t>(expected.end() - 100, expected.end()), file->read(8192, 100));
    EXPECT_THROW(file->read(8192, 101), Out_of_range_error);
    EXPECT_TRUE(file->read(file->logical_bytes(), 0).empty());
    EXPECT_THROW(file->read(file->logical_bytes() + 1, 0), Out_of_range_error);

    //the hunk itself is whole
    std::vector<uint8_t> hunk(4096);
    file->read_hunk(2, hunk.data());
    EXPECT_EQ(pattern_hunk(4096, 2), hunk);
    EXPECT_THROW(file->read_hunk(3, hunk.data()), Out_of_range_error);
}

TEST(CHDFile, SelfCopyCycles)
{
    Test_Image image(5, 4096);
    for (uint32_t i = 0; i < 5; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(4096, i);
        image.add_compressed(0, stored_deflate(data), data);
    }
    image.add_self(5);
    image.add_self(7);
    image.add_self(6);
    image.add_self(4);
    std::unique_ptr<CHD_File> file = open_bytes(image.build());

    std::vector<uint8_t> buffer(4096);
    EXPECT_THROW(file->read_hunk(5, buffer.data()), Resolution_cycle_error);
    EXPECT_THROW(file->read_hunk(6, buffer.data()), Resolution_cycle_error);
    EXPECT_THROW(file->read_hunk(7, buffer.data()), Resolution_cycle_error);

    //the rest of the image is still readable
    file->read_hunk(8, buffer.data());
    EXPECT_EQ(pattern_hunk(4096, 4), buffer);
    file->read_hunk(0, buffer.data());
    EXPECT_EQ(pattern_hunk(4096, 0), buffer);
}

TEST(CHDFile, CycleThroughContextCodec)
{
    Codec_Registry codecs = delta_registry();

    //hunk 0 copies hunk 1, which needs hunk 0 as its context
    Test_Image image(5, 1024);
    image.set_compressors({DELTA_CODEC});
    image.add_self(1);
    std::vector<uint8_t> delta = pattern_hunk(1024, 3);
    image.add_compressed(0, delta, delta);
    std::vector<uint8_t> plain = pattern_hunk(1024, 4);
    image.add_uncompressed(plain);
    std::vector<uint8_t> bytes = image.build();

    for (bool threaded : {false, true})
    {
        for (uint32_t capacity : {0u, 16u})
        {
            CHD_Options options;
            options.codecs = &codecs;
            options.multithreaded = threaded;
            options.cache_hunks = capacity;
            std::unique_ptr<CHD_File> file = open_bytes(bytes, options);

            EXPECT_THROW(file->read(1024, 1024), Resolution_cycle_error);
            EXPECT_THROW(file->read(0, 1024), Resolution_cycle_error);
            EXPECT_EQ(plain, file->read(2048, 1024));

            //both ends of the loop at once
            std::thread other([&file]()
            {
                EXPECT_THROW(file->read(0, 1024), Resolution_cycle_error);
            });
            EXPECT_THROW(file->read(1024, 1024), Resolution_cycle_error);
            other.join();

            try
            {
                CHD_Verifier::verify_image(*file);
                ADD_FAILURE() << "verification passed";
            }
            catch (Integrity_error& e)
            {
                EXPECT_EQ((std::vector<uint32_t>{0, 1}), e.hunks());
            }
        }
    }
}

TEST(CHDFile, LongContextRunWithoutCache)
{
    Codec_Registry codecs = delta_registry();
    Test_Image image(5, 64);
    image.set_compressors({DELTA_CODEC});
    add_delta_run(image, 64, 5000);
    std::vector<uint8_t> bytes = image.build();

    CHD_Options options;
    options.codecs = &codecs;
    options.cache_hunks = 0;
    std::unique_ptr<CHD_File> file = open_bytes(bytes, options);
    EXPECT_EQ(pattern_hunk(64, 4999 + 10), file->read(4999 * 64, 64));
    EXPECT_EQ(pattern_hunk(64, 4500 + 10), file->read(4500 * 64, 64));
    EXPECT_NO_THROW(CHD_Verifier::verify_image(*file));
}

TEST(CHDFile, CacheIsNeverLargerThanTheImage)
{
    Test_Image image = mixed_image();
    CHD_Options options;
    options.cache_hunks = 0xFFFFFFFF;
    std::unique_ptr<CHD_File> file = open_bytes(image.build(), options);

    EXPECT_EQ(6u, file->cache().capacity());
    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));
    EXPECT_EQ(6u, file->cache().resident());
}

TEST(CHDFile, HunkChecksCatchCorruption)
{
    Test_Image image(5, 4096);
    for (uint32_t i = 0; i < 4; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(4096, i);
        image.add_compressed(0, stored_deflate(data), data);
    }
    std::vector<uint8_t> bytes = image.build();
    bytes[image.data_offset(2) + 5] ^= 0x01;

    CHD_Options options;
    options.verify_hunks = true;
    std::unique_ptr<CHD_File> file = open_bytes(bytes, options);

    std::vector<uint8_t> buffer(4096);
    try
    {
        file->read_hunk(2, buffer.data());
        FAIL() << "corrupted hunk was accepted";
    }
    catch (Integrity_error& e)
    {
        EXPECT_EQ(std::vector<uint32_t>{2}, e.hunks());
    }
    EXPECT_FALSE(file->cache().contains(2));

    file->read_hunk(3, buffer.data());
    EXPECT_EQ(pattern_hunk(4096, 3), buffer);

    //without checks the damaged data comes straight through
    std::unique_ptr<CHD_File> unchecked = open_bytes(bytes);
    unchecked->read_hunk(2, buffer.data());
    EXPECT_NE(pattern_hunk(4096, 2), buffer);
}

TEST(CHDFile, V4HunkChecksUseCRC32)
{
    Test_Image image(4, 2048);
    image.add_uncompressed(pattern_hunk(2048, 1));
    image.add_uncompressed(pattern_hunk(2048, 2));
    std::vector<uint8_t> bytes = image.build();
    bytes[image.data_offset(1) + 100] ^= 0x80;

    CHD_Options options;
    options.verify_hunks = true;
    std::unique_ptr<CHD_File> file = open_bytes(bytes, options);
    std::vector<uint8_t> buffer(2048);
    file->read_hunk(0, buffer.data());
    EXPECT_THROW(file->read_hunk(1, buffer.data()), Integrity_error);
}

TEST(CHDFile, UncompressedLengthMismatch)
{
    Test_Image image(4, 2048);
    image.add_uncompressed(pattern_hunk(2048, 1));
    image.add_uncompressed(pattern_hunk(2048, 2));
    std::vector<uint8_t> bytes = image.build();
    put_be16(&bytes[CHD_V4_HEADER_SIZE + CHD_V34_MAP_ENTRY_SIZE + 12], 2000);

    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    std::vector<uint8_t> buffer(2048);
    file->read_hunk(0, buffer.data());
    EXPECT_THROW(file->read_hunk(1, buffer.data()), Size_mismatch_error);
}

TEST(CHDFile, CorruptStreamIsCodecError)
{
    Test_Image image(5, 4096);
    std::vector<uint8_t> data = pattern_hunk(4096, 1);
    image.add_compressed(0, stored_deflate(data), data);
    image.add_compressed(0, std::vector<uint8_t>(64, 0xFF), data);
    std::unique_ptr<CHD_File> file = open_bytes(image.build());

    std::vector<uint8_t> buffer(4096);
    EXPECT_THROW(file->read_hunk(1, buffer.data()), Codec_error);
    EXPECT_THROW(file->read(4096, 16), Codec_error);
    file->read_hunk(0, buffer.data());
    EXPECT_EQ(data, buffer);
}

TEST(CHDFile, ConcurrentReadersShareOneDecode)
{
    std::atomic<int> calls(0);
    Codec_Registry codecs = Codec_Registry::defaults();
    codecs.add(COUNTING_CODEC, "Counting deflate", [&calls](uint32_t)
    {
        return std::unique_ptr<CHD_Codec>(new Counting_Codec(&calls));
    });

    Test_Image image(5, 4096);
    image.set_compressors({COUNTING_CODEC});
    std::vector<uint8_t> a = pattern_hunk(4096, 1);
    std::vector<uint8_t> b = pattern_hunk(4096, 2);
    image.add_compressed(0, stored_deflate(a), a);
    image.add_compressed(0, stored_deflate(b), b);

    CHD_Options options;
    options.codecs = &codecs;
    std::unique_ptr<CHD_File> file = open_bytes(image.build(), options);

    std::atomic<bool> go(false);
    std::atomic<int> matches(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++)
    {
        threads.emplace_back([&]()
        {
            while (!go)
                std::this_thread::yield();
            if (file->read(4096, 4096) == b)
                matches++;
        });
    }
    go = true;
    for (std::thread& t : threads)
        t.join();

    EXPECT_EQ(8, matches.load());
    EXPECT_EQ(1, calls.load());
}

TEST(CHDFile, ContextCodecDecodesRunsInOrder)
{
    Codec_Registry codecs = delta_registry();
    Test_Image image(5, 1024);
    image.set_compressors({DELTA_CODEC});
    add_delta_run(image, 1024, 8);
    std::vector<uint8_t> bytes = image.build();
    std::vector<uint8_t> expected = image.logical_data();

    for (uint32_t capacity : {0u, 2u, 16u})
    {
        CHD_Options options;
        options.codecs = &codecs;
        options.cache_hunks = capacity;
        options.verify_hunks = true;
        std::unique_ptr<CHD_File> file = open_bytes(bytes, options);

        //start in the middle so the earlier hunks have to be decoded first
        std::vector<uint8_t> data = file->read(5 * 1024, 1024);
        EXPECT_TRUE(std::equal(data.begin(), data.end(), expected.begin() + 5 * 1024)) << "cache of " << capacity;
        EXPECT_EQ(expected, file->read(0, file->logical_bytes())) << "cache of " << capacity;
        data = file->read(7 * 1024, 1024);
        EXPECT_TRUE(std::equal(data.begin(), data.end(), expected.begin() + 7 * 1024)) << "cache of " << capacity;
        EXPECT_NO_THROW(CHD_Verifier::verify_image(*file)) << "cache of " << capacity;
    }

    //a damaged hunk spoils every hunk decoded on top of it
    bytes[image.data_offset(3) + 17] ^= 0x10;
    CHD_Options options;
    options.codecs = &codecs;
    std::unique_ptr<CHD_File> file = open_bytes(bytes, options);
    try
    {
        CHD_Verifier::verify_image(*file);
        ADD_FAILURE() << "verification passed";
    }
    catch (Integrity_error& e)
    {
        EXPECT_EQ((std::vector<uint32_t>{3, 4, 5, 6, 7}), e.hunks());
    }
}

TEST(CHDFile, SingleThreadedMode)
{
    Test_Image image = mixed_image();
    CHD_Options options;
    options.multithreaded = false;
    options.cache_hunks = 2;
    std::unique_ptr<CHD_File> file = open_bytes(image.build(), options);

    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));
    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));
    EXPECT_EQ(2u, file->cache().resident());
}

TEST(CHDFile, ReadsV4Image)
{
    Test_Image image(4, 2048);
    std::vector<uint8_t> a = text_hunk(2048, "sector data ");
    std::vector<uint8_t> b = pattern_hunk(2048, 9);
    image.add_compressed(0, libdeflate_compress_buffer(a), a);
    image.add_uncompressed(b);
    image.add_mini(0xDEADBEEFCAFEF00Dull);
    image.add_self(0);
    image.add_mini(0);

    std::unique_ptr<CHD_File> file = open_bytes(image.build());
    EXPECT_EQ(4u, file->version());
    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));

    std::vector<uint8_t> mini = file->read(2 * 2048, 8);
    const uint8_t literal[8] = {0xDE, 0xAD, 0xBE, 0xEF, 0xCA, 0xFE, 0xF0, 0x0D};
    EXPECT_EQ(std::vector<uint8_t>(literal, literal + 8), mini);
}

TEST(CHDFile, ReadsV3Image)
{
    Test_Image image(3, 1024);
    for (uint32_t i = 0; i < 4; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(1024, i);
        image.add_compressed(0, stored_deflate(data), data);
    }
    std::unique_ptr<CHD_File> file = open_bytes(image.build());
    EXPECT_EQ(3u, file->version());
    EXPECT_EQ(file->sha1(), file->raw_sha1());
    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));
}

TEST(CHDFile, ReadsV5UncompressedImage)
{
    Test_Image image(5, 4096);
    image.set_compressors({});
    image.add_uncompressed(pattern_hunk(4096, 1));
    image.add_unallocated(std::vector<uint8_t>(4096));
    image.add_uncompressed(pattern_hunk(4096, 3));

    std::unique_ptr<CHD_File> file = open_bytes(image.build());
    EXPECT_EQ(image.logical_data(), file->read(0, file->logical_bytes()));
}

TEST(CHDFile, MissingFileIsSourceError)
{
    EXPECT_THROW(CHD_File::open("/nonexistent/dir/image.chd"), Source_io_error);
}
