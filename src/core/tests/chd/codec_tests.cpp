#include <gtest/gtest.h>
#include <cstring>
#include <lzma.h>
#include "test_image.hpp"
#include "../../chd/codec.hpp"
#include "../../chd/codecs/cd_codec.hpp"
#include "../../chd/codecs/deflate_codec.hpp"
#include "../../chd/codecs/huff_codec.hpp"
#include "../../chd/codecs/lzma_codec.hpp"
#include "../../errors.hpp"

static std::vector<uint8_t> pack_bits(const std::string& bits)
{
    std::vector<uint8_t> out((bits.size() + 7) / 8);
    for (size_t i = 0; i < bits.size(); i++)
    {
        if (bits[i] == '1')
            out[i / 8] |= (uint8_t)(0x80 >> (i % 8));
    }
    return out;
}

static std::vector<uint8_t> lzma_compress(const std::vector<uint8_t>& data, uint32_t hunk_bytes)
{
    lzma_options_lzma options;
    lzma_lzma_preset(&options, 9);
    options.dict_size = LZMA_Codec::dictionary_size(hunk_bytes);
    options.lc = 3;
    options.lp = 0;
    options.pb = 2;

    lzma_filter filters[2] = {{LZMA_FILTER_LZMA1, &options}, {LZMA_VLI_UNKNOWN, nullptr}};
    lzma_stream stream = LZMA_STREAM_INIT;
    if (lzma_raw_encoder(&stream, filters) != LZMA_OK)
        throw std::runtime_error("lzma_raw_encoder failed");

    std::vector<uint8_t> out(data.size() + 1024);
    stream.next_in = data.data();
    stream.avail_in = data.size();
    stream.next_out = out.data();
    stream.avail_out = out.size();
    lzma_ret ret;
    do
    {
        ret = lzma_code(&stream, LZMA_FINISH);
    } while (ret == LZMA_OK);
    out.resize(out.size() - stream.avail_out);
    lzma_end(&stream);
    if (ret != LZMA_STREAM_END)
        throw std::runtime_error("lzma_code failed");
    return out;
}

TEST(Codec, TagNames)
{
    EXPECT_EQ("zlib", tag_to_string(CHD_CODEC_ZLIB));
    EXPECT_EQ("cdlz", tag_to_string(CHD_CODEC_CD_LZMA));
    EXPECT_EQ("????", tag_to_string(0x01020304));
}

TEST(Codec, DefaultRegistry)
{
    const Codec_Registry& codecs = Codec_Registry::defaults();
    EXPECT_TRUE(codecs.has(CHD_CODEC_ZLIB));
    EXPECT_TRUE(codecs.has(CHD_CODEC_LZMA));
    EXPECT_TRUE(codecs.has(CHD_CODEC_HUFFMAN));
    EXPECT_TRUE(codecs.has(CHD_CODEC_CD_ZLIB));
    EXPECT_TRUE(codecs.has(CHD_CODEC_CD_LZMA));
    EXPECT_FALSE(codecs.has(CHD_CODEC_FLAC));
    EXPECT_THROW(codecs.create(CHD_CODEC_FLAC, 4096), Codec_error);
}

TEST(Codec, RegistryAcceptsNewCodecs)
{
    Codec_Registry codecs = Codec_Registry::defaults();
    codecs.add(CHD_CODEC_ZSTD, "Pretend Zstandard", [](uint32_t)
    {
        return std::unique_ptr<CHD_Codec>(new Deflate_Codec());
    });
    EXPECT_TRUE(codecs.has(CHD_CODEC_ZSTD));
    EXPECT_EQ("Pretend Zstandard", codecs.name(CHD_CODEC_ZSTD));
    EXPECT_NE(nullptr, codecs.create(CHD_CODEC_ZSTD, 4096));
    EXPECT_FALSE(Codec_Registry::defaults().has(CHD_CODEC_ZSTD));
}

TEST(Codec, DeflateStoredAndCompressed)
{
    std::vector<uint8_t> data = pattern_hunk(4096, 7);
    std::vector<uint8_t> out(4096);
    Deflate_Codec codec;

    std::vector<uint8_t> stored = stored_deflate(data);
    codec.decompress(stored.data(), (uint32_t)stored.size(), out.data(), (uint32_t)out.size(), nullptr);
    EXPECT_EQ(data, out);

    std::vector<uint8_t> text(4096);
    for (size_t i = 0; i < text.size(); i++)
        text[i] = "hunks of data "[i % 14];
    std::vector<uint8_t> compressed = libdeflate_compress_buffer(text);
    EXPECT_LT(compressed.size(), text.size());
    codec.decompress(compressed.data(), (uint32_t)compressed.size(), out.data(), (uint32_t)out.size(), nullptr);
    EXPECT_EQ(text, out);
}

TEST(Codec, DeflateShortOutputFails)
{
    std::vector<uint8_t> data = pattern_hunk(1000, 1);
    std::vector<uint8_t> stored = stored_deflate(data);
    std::vector<uint8_t> out(4096);
    Deflate_Codec codec;
    EXPECT_THROW(codec.decompress(stored.data(), (uint32_t)stored.size(), out.data(), (uint32_t)out.size(), nullptr),
                 Codec_error);
}

TEST(Codec, DeflateGarbageFails)
{
    std::vector<uint8_t> garbage(64, 0xFF);
    std::vector<uint8_t> out(4096);
    Deflate_Codec codec;
    EXPECT_THROW(codec.decompress(garbage.data(), (uint32_t)garbage.size(), out.data(), (uint32_t)out.size(), nullptr),
                 Codec_error);
}

TEST(Codec, LZMADictionarySize)
{
    EXPECT_EQ(4096u, LZMA_Codec::dictionary_size(4096));
    EXPECT_EQ(24576u, LZMA_Codec::dictionary_size(19584));
    EXPECT_EQ(65536u, LZMA_Codec::dictionary_size(65536));
    EXPECT_EQ(1u << 26, LZMA_Codec::dictionary_size(1u << 27));
}

TEST(Codec, LZMARawStream)
{
    std::vector<uint8_t> data(19584);
    for (size_t i = 0; i < data.size(); i++)
        data[i] = (uint8_t)((i * 7) ^ (i >> 5));
    std::vector<uint8_t> compressed = lzma_compress(data, (uint32_t)data.size());

    LZMA_Codec codec((uint32_t)data.size());
    std::vector<uint8_t> out(data.size());
    codec.decompress(compressed.data(), (uint32_t)compressed.size(), out.data(), (uint32_t)out.size(), nullptr);
    EXPECT_EQ(data, out);
}

TEST(Codec, LZMATruncatedFails)
{
    std::vector<uint8_t> data = pattern_hunk(8192, 3);
    std::vector<uint8_t> compressed = lzma_compress(data, 8192);
    compressed.resize(compressed.size() / 2);

    LZMA_Codec codec(8192);
    std::vector<uint8_t> out(8192);
    EXPECT_THROW(codec.decompress(compressed.data(), (uint32_t)compressed.size(), out.data(), 8192, nullptr), Codec_error);
}

TEST(Codec, HuffmanSingleSymbol)
{
    //small tree: code 0 is 2 bits, code 1 is 1 bit, code 2 is 2 bits, the rest unused
    std::string bits = "010" "000" "001" "010" "111";
    //lengths: one zero, 64 more, one 1 bit code for 'A', one zero, 189 more
    bits += "1" "00" "111" "00110111" "01" "1" "00" "111" "10110100";
    //64 bytes, each the single bit code 0
    bits += std::string(64, '0');
    std::vector<uint8_t> src = pack_bits(bits);

    Huff_Codec codec;
    std::vector<uint8_t> out(64);
    codec.decompress(src.data(), (uint32_t)src.size(), out.data(), (uint32_t)out.size(), nullptr);
    EXPECT_EQ(std::vector<uint8_t>(64, 'A'), out);
}

TEST(Codec, HuffmanBadTreeFails)
{
    //small tree code 0 claims 7 bits, more than the small tree allows
    std::string bits = "111" "000" "111";
    std::vector<uint8_t> src = pack_bits(bits + std::string(64, '0'));

    Huff_Codec codec;
    std::vector<uint8_t> out(16);
    EXPECT_THROW(codec.decompress(src.data(), (uint32_t)src.size(), out.data(), (uint32_t)out.size(), nullptr),
                 Codec_error);
}

TEST(Codec, CDFramesRebuildSyncAndECC)
{
    const uint32_t frames = 4;
    std::vector<uint8_t> sectors(frames * CD_MAX_SECTOR_DATA);
    std::vector<uint8_t> subcode(frames * CD_MAX_SUBCODE_DATA);
    for (size_t i = 0; i < sectors.size(); i++)
        sectors[i] = (uint8_t)(i * 13);
    for (size_t i = 0; i < subcode.size(); i++)
        subcode[i] = (uint8_t)(0xF0 ^ i);

    //frame 0 is a proper mode 1 sector
    uint8_t* sector = sectors.data();
    const uint8_t sync[12] = {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};
    memcpy(sector, sync, sizeof(sync));
    sector[12] = 0x00;
    sector[13] = 0x02;
    sector[14] = 0x00;
    sector[15] = 0x01;
    ecc_generate(sector);

    std::vector<uint8_t> expected(frames * CD_FRAME_SIZE);
    for (uint32_t f = 0; f < frames; f++)
    {
        memcpy(&expected[f * CD_FRAME_SIZE], &sectors[f * CD_MAX_SECTOR_DATA], CD_MAX_SECTOR_DATA);
        memcpy(&expected[f * CD_FRAME_SIZE + CD_MAX_SECTOR_DATA], &subcode[f * CD_MAX_SUBCODE_DATA], CD_MAX_SUBCODE_DATA);
    }

    //what an encoder stores for it: no sync, no parity
    memset(sector, 0, sizeof(sync));
    memset(sector + 0x81C, 0, CD_MAX_SECTOR_DATA - 0x81C);

    std::vector<uint8_t> base = stored_deflate(sectors);
    std::vector<uint8_t> sub = libdeflate_compress_buffer(subcode);
    std::vector<uint8_t> src;
    src.push_back(0x01);
    src.push_back((uint8_t)(base.size() >> 8));
    src.push_back((uint8_t)base.size());
    src.insert(src.end(), base.begin(), base.end());
    src.insert(src.end(), sub.begin(), sub.end());

    std::unique_ptr<CHD_Codec> codec = Codec_Registry::defaults().create(CHD_CODEC_CD_ZLIB, frames * CD_FRAME_SIZE);
    std::vector<uint8_t> out(frames * CD_FRAME_SIZE);
    codec->decompress(src.data(), (uint32_t)src.size(), out.data(), (uint32_t)out.size(), nullptr);
    EXPECT_EQ(expected, out);
}

TEST(Codec, CDRejectsPartialFrames)
{
    std::unique_ptr<CHD_Codec> codec = Codec_Registry::defaults().create(CHD_CODEC_CD_ZLIB, 4096);
    std::vector<uint8_t> src(16);
    std::vector<uint8_t> out(4096);
    EXPECT_THROW(codec->decompress(src.data(), (uint32_t)src.size(), out.data(), 4096, nullptr), Codec_error);
}
