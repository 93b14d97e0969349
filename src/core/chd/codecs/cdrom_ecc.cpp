#include "cd_codec.hpp"

/*
Reed-Solomon P/Q parity for CD-ROM sectors (ECMA-130 annex A).
P covers 86 columns of 24 bytes, Q covers 52 diagonals of 43 bytes.
Offsets are relative to the byte after the 12 byte sync header.
*/

#define ECC_P_OFFSET 0x81C
#define ECC_P_NUM_BYTES 86
#define ECC_P_COMP 24
#define ECC_Q_OFFSET (ECC_P_OFFSET + 2 * ECC_P_NUM_BYTES)
#define ECC_Q_NUM_BYTES 52
#define ECC_Q_COMP 43

#define MODE_OFFSET 0x00F
#define SYNC_NUM_BYTES 12

namespace
{

struct ECC_Tables
{
    uint8_t low[256];   // x * 2 in GF(2^8)
    uint8_t high[256];  // x / 3 in GF(2^8)
    uint16_t poffsets[ECC_P_NUM_BYTES][ECC_P_COMP];
    uint16_t qoffsets[ECC_Q_NUM_BYTES][ECC_Q_COMP];

    ECC_Tables()
    {
        for (int i = 0; i < 256; i++)
            low[i] = (uint8_t)((i << 1) ^ ((i & 0x80) ? 0x11D : 0));
        for (int i = 0; i < 256; i++)
            high[low[i] ^ i] = (uint8_t)i;

        for (int byte = 0; byte < ECC_P_NUM_BYTES; byte++)
        {
            for (int comp = 0; comp < ECC_P_COMP; comp++)
                poffsets[byte][comp] = (uint16_t)(byte + comp * ECC_P_NUM_BYTES);
        }

        for (int byte = 0; byte < ECC_Q_NUM_BYTES; byte++)
        {
            int vector = byte / 2;
            for (int comp = 0; comp < ECC_Q_COMP; comp++)
            {
                int word = (44 * comp + 43 * vector) % 1118;
                qoffsets[byte][comp] = (uint16_t)(word * 2 + (byte & 1));
            }
        }
    }
};

const ECC_Tables& ecc_tables()
{
    static const ECC_Tables tables;
    return tables;
}

uint8_t ecc_source_byte(const uint8_t* sector, uint32_t offset)
{
    // in mode 2 always treat the header bytes as 0
    return (sector[MODE_OFFSET] == 2 && offset < 4) ? 0x00 : sector[SYNC_NUM_BYTES + offset];
}

void ecc_compute_bytes(const uint8_t* sector, const uint16_t* row, int rowlen, uint8_t& val1, uint8_t& val2)
{
    const ECC_Tables& t = ecc_tables();
    val1 = val2 = 0;
    for (int component = 0; component < rowlen; component++)
    {
        uint8_t byte = ecc_source_byte(sector, row[component]);
        val1 ^= byte;
        val2 ^= byte;
        val1 = t.low[val1];
    }
    val1 = t.high[t.low[val1] ^ val2];
    val2 ^= val1;
}

}

void ecc_generate(uint8_t* sector)
{
    const ECC_Tables& t = ecc_tables();
    for (int byte = 0; byte < ECC_P_NUM_BYTES; byte++)
    {
        ecc_compute_bytes(sector, t.poffsets[byte], ECC_P_COMP,
                          sector[ECC_P_OFFSET + byte], sector[ECC_P_OFFSET + ECC_P_NUM_BYTES + byte]);
    }
    for (int byte = 0; byte < ECC_Q_NUM_BYTES; byte++)
    {
        ecc_compute_bytes(sector, t.qoffsets[byte], ECC_Q_COMP,
                          sector[ECC_Q_OFFSET + byte], sector[ECC_Q_OFFSET + ECC_Q_NUM_BYTES + byte]);
    }
}
