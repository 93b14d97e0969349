#ifndef LZMA_CODEC_HPP
#define LZMA_CODEC_HPP
#include "../codec.hpp"

//Raw LZMA1 with no header and no end marker. The properties aren't stored in the
//file, they are derived from the hunk size the same way the encoder derived them.
class LZMA_Codec : public CHD_Codec
{
    public:
        LZMA_Codec(uint32_t hunk_bytes);

        void decompress(const uint8_t* src, uint32_t src_len,
                        uint8_t* dest, uint32_t dest_len, const uint8_t* context) override;

        //Dictionary size the LZMA SDK picks for level 9 when told the input is at most hunk_bytes long
        static uint32_t dictionary_size(uint32_t hunk_bytes);
    private:
        uint32_t m_dict_size;
};

#endif // LZMA_CODEC_HPP
