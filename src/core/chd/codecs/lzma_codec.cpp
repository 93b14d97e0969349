#include "lzma_codec.hpp"
#include "../../errors.hpp"
#include <cstring>
#include <lzma.h>

LZMA_Codec::LZMA_Codec(uint32_t hunk_bytes) : m_dict_size(dictionary_size(hunk_bytes))
{

}

uint32_t LZMA_Codec::dictionary_size(uint32_t hunk_bytes)
{
    uint32_t dict_size = 1 << 26;
    if (dict_size > hunk_bytes)
    {
        for (int i = 11; i <= 30; i++)
        {
            if (hunk_bytes <= ((uint32_t)2 << i))
                return (uint32_t)2 << i;
            if (hunk_bytes <= ((uint32_t)3 << i))
                return (uint32_t)3 << i;
        }
    }
    return dict_size;
}

void LZMA_Codec::decompress(const uint8_t* src, uint32_t src_len,
                            uint8_t* dest, uint32_t dest_len, const uint8_t*)
{
    lzma_options_lzma options;
    memset(&options, 0, sizeof(lzma_options_lzma));
    options.dict_size = m_dict_size;
    options.lc = 3;
    options.lp = 0;
    options.pb = 2;

    lzma_filter filters[2] = {{LZMA_FILTER_LZMA1, &options}, {LZMA_VLI_UNKNOWN, nullptr}};
    lzma_stream stream = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_raw_decoder(&stream, filters);
    if (ret != LZMA_OK)
        Errors::raise<Codec_error>("lzma_raw_decoder failed (%d)", (int)ret);

    stream.next_in = src;
    stream.avail_in = src_len;
    stream.next_out = dest;
    stream.avail_out = dest_len;

    // No end marker, so stop as soon as the hunk is full
    while (stream.avail_out > 0)
    {
        size_t before = stream.avail_out;
        ret = lzma_code(&stream, LZMA_RUN);
        if (ret != LZMA_OK)
            break;
        if (stream.avail_out == before && stream.avail_in == 0)
            break;
    }

    size_t missing = stream.avail_out;
    lzma_end(&stream);

    if (ret != LZMA_OK && ret != LZMA_STREAM_END)
        Errors::raise<Codec_error>("lzma_code failed (%d)", (int)ret);
    if (missing)
        Errors::raise<Codec_error>("lzma stream ended %zu bytes short of %u", missing, dest_len);
}
