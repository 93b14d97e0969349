#include "deflate_codec.hpp"
#include "../../errors.hpp"
#include <libdeflate.h>

Deflate_Codec::Deflate_Codec() : m_inflate(libdeflate_alloc_decompressor())
{
    if (!m_inflate)
        Errors::raise<Codec_error>("failed to allocate decompressor");
}

Deflate_Codec::~Deflate_Codec()
{
    libdeflate_free_decompressor(m_inflate);
}

void Deflate_Codec::decompress(const uint8_t* src, uint32_t src_len,
                               uint8_t* dest, uint32_t dest_len, const uint8_t*)
{
    size_t read = 0;
    auto res = libdeflate_deflate_decompress(m_inflate, src, src_len, dest, dest_len, &read);
    if (res != LIBDEFLATE_SUCCESS)
        Errors::raise<Codec_error>("libdeflate error %d", (int)res);
    if (read != dest_len)
        Errors::raise<Codec_error>("deflate stream decoded to %zu bytes, expected %u", read, dest_len);
}
