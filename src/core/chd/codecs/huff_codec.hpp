#ifndef HUFF_CODEC_HPP
#define HUFF_CODEC_HPP
#include "../codec.hpp"
#include "../huffman.hpp"

//8-bit symbols, 16-bit max code length, tree stored at the front of every hunk
class Huff_Codec : public CHD_Codec
{
    public:
        Huff_Codec();

        void decompress(const uint8_t* src, uint32_t src_len,
                        uint8_t* dest, uint32_t dest_len, const uint8_t* context) override;
    private:
        Huffman_Decoder m_decoder;
};

#endif // HUFF_CODEC_HPP
