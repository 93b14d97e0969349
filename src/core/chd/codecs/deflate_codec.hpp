#ifndef DEFLATE_CODEC_HPP
#define DEFLATE_CODEC_HPP
#include "../codec.hpp"

//CHD's "zlib" codec. The payload is a raw deflate stream with no zlib wrapper.
class Deflate_Codec : public CHD_Codec
{
    public:
        Deflate_Codec();
        ~Deflate_Codec();

        void decompress(const uint8_t* src, uint32_t src_len,
                        uint8_t* dest, uint32_t dest_len, const uint8_t* context) override;
    private:
        struct libdeflate_decompressor* m_inflate;
};

#endif // DEFLATE_CODEC_HPP
