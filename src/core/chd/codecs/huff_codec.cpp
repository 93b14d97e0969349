#include "huff_codec.hpp"
#include "../../errors.hpp"

Huff_Codec::Huff_Codec() : m_decoder(256, 16)
{

}

void Huff_Codec::decompress(const uint8_t* src, uint32_t src_len,
                            uint8_t* dest, uint32_t dest_len, const uint8_t*)
{
    Bit_Reader bits(src, src_len);
    if (!m_decoder.import_tree_huffman(bits))
        Errors::raise<Codec_error>("invalid huffman tree");

    for (uint32_t cur = 0; cur < dest_len; cur++)
        dest[cur] = (uint8_t)m_decoder.decode_one(bits);

    if (bits.overflow())
        Errors::raise<Codec_error>("huffman data ran past the end of the hunk");
}
