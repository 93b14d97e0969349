#include "cd_codec.hpp"
#include "../../errors.hpp"
#include <cstring>

static const uint8_t cd_sync_header[12] = {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};

CD_Codec::CD_Codec(std::unique_ptr<CHD_Codec> base, std::unique_ptr<CHD_Codec> subcode) :
    m_base(std::move(base)), m_subcode(std::move(subcode))
{

}

void CD_Codec::decompress(const uint8_t* src, uint32_t src_len,
                          uint8_t* dest, uint32_t dest_len, const uint8_t*)
{
    if (dest_len % CD_FRAME_SIZE)
        Errors::raise<Codec_error>("hunk size %u is not a whole number of CD frames", dest_len);

    // determine header bytes
    uint32_t frames = dest_len / CD_FRAME_SIZE;
    uint32_t complen_bytes = (dest_len < 65536) ? 2 : 3;
    uint32_t ecc_bytes = (frames + 7) / 8;
    uint32_t header_bytes = ecc_bytes + complen_bytes;
    if (src_len < header_bytes)
        Errors::raise<Codec_error>("CD hunk of %u bytes is too short for its header", src_len);

    // extract compressed length of base
    uint32_t complen_base = (src[ecc_bytes + 0] << 8) | src[ecc_bytes + 1];
    if (complen_bytes > 2)
        complen_base = (complen_base << 8) | src[ecc_bytes + 2];
    if (complen_base > src_len - header_bytes)
        Errors::raise<Codec_error>("CD base stream length %u overruns the hunk", complen_base);

    m_buffer.resize(frames * CD_MAX_SECTOR_DATA + frames * CD_MAX_SUBCODE_DATA);
    uint8_t* sectors = m_buffer.data();
    uint8_t* subcode = m_buffer.data() + frames * CD_MAX_SECTOR_DATA;

    m_base->decompress(&src[header_bytes], complen_base, sectors, frames * CD_MAX_SECTOR_DATA, nullptr);
    m_subcode->decompress(&src[header_bytes + complen_base], src_len - complen_base - header_bytes,
                          subcode, frames * CD_MAX_SUBCODE_DATA, nullptr);

    // reassemble the data
    for (uint32_t framenum = 0; framenum < frames; framenum++)
    {
        uint8_t* sector = &dest[framenum * CD_FRAME_SIZE];
        memcpy(sector, &sectors[framenum * CD_MAX_SECTOR_DATA], CD_MAX_SECTOR_DATA);
        memcpy(sector + CD_MAX_SECTOR_DATA, &subcode[framenum * CD_MAX_SUBCODE_DATA], CD_MAX_SUBCODE_DATA);

        // reconstitute the ECC data and sync header
        if (src[framenum / 8] & (1 << (framenum % 8)))
        {
            memcpy(sector, cd_sync_header, sizeof(cd_sync_header));
            ecc_generate(sector);
        }
    }
}
