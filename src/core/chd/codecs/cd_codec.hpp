#ifndef CD_CODEC_HPP
#define CD_CODEC_HPP
#include <memory>
#include <vector>
#include "../codec.hpp"

constexpr uint32_t CD_MAX_SECTOR_DATA = 2352;
constexpr uint32_t CD_MAX_SUBCODE_DATA = 96;
constexpr uint32_t CD_FRAME_SIZE = CD_MAX_SECTOR_DATA + CD_MAX_SUBCODE_DATA;

//Rebuilds the P and Q parity of a raw mode 1/mode 2 form 1 sector in place
void ecc_generate(uint8_t* sector);

/*
CD frame codec (cdzl, cdlz).
Layout: ECC bitmap (one bit per frame), base stream length (2 bytes, 3 if the hunk
is 64K or larger), base stream with all sector data, subcode stream.
Frames flagged in the bitmap had their sync header and ECC stripped by the encoder.
*/
class CD_Codec : public CHD_Codec
{
    public:
        CD_Codec(std::unique_ptr<CHD_Codec> base, std::unique_ptr<CHD_Codec> subcode);

        void decompress(const uint8_t* src, uint32_t src_len,
                        uint8_t* dest, uint32_t dest_len, const uint8_t* context) override;
    private:
        std::unique_ptr<CHD_Codec> m_base;
        std::unique_ptr<CHD_Codec> m_subcode;
        std::vector<uint8_t> m_buffer;
};

#endif // CD_CODEC_HPP
