#include "checksum.hpp"
#include "../errors.hpp"

#include <libdeflate.h>
#include <openssl/evp.h>

namespace
{

struct CRC16_Table
{
    uint16_t entries[256];

    CRC16_Table()
    {
        for (int i = 0; i < 256; i++)
        {
            uint16_t crc = (uint16_t)(i << 8);
            for (int bit = 0; bit < 8; bit++)
                crc = (crc & 0x8000) ? (uint16_t)((crc << 1) ^ 0x1021) : (uint16_t)(crc << 1);
            entries[i] = crc;
        }
    }
};

const CRC16_Table& crc16_table()
{
    static const CRC16_Table table;
    return table;
}

}

uint16_t crc16(const uint8_t* data, size_t length)
{
    const CRC16_Table& table = crc16_table();
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < length; i++)
        crc = (uint16_t)((crc << 8) ^ table.entries[(crc >> 8) ^ data[i]]);
    return crc;
}

uint32_t crc32(const uint8_t* data, size_t length)
{
    return libdeflate_crc32(0, data, length);
}

bool sha1_is_zero(const SHA1_Digest& digest)
{
    for (uint8_t byte : digest)
    {
        if (byte)
            return false;
    }
    return true;
}

std::string sha1_to_string(const SHA1_Digest& digest)
{
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(40);
    for (uint8_t byte : digest)
    {
        out += hex[byte >> 4];
        out += hex[byte & 0xF];
    }
    return out;
}

SHA1_Hasher::SHA1_Hasher() : m_ctx(EVP_MD_CTX_new())
{
    if (!m_ctx || EVP_DigestInit_ex(m_ctx, EVP_sha1(), nullptr) != 1)
    {
        EVP_MD_CTX_free(m_ctx);
        m_ctx = nullptr;
        Errors::raise<CHD_Error>("failed to set up SHA-1 context");
    }
}

SHA1_Hasher::~SHA1_Hasher()
{
    EVP_MD_CTX_free(m_ctx);
}

void SHA1_Hasher::update(const uint8_t* data, size_t length)
{
    if (EVP_DigestUpdate(m_ctx, data, length) != 1)
        Errors::raise<CHD_Error>("SHA-1 update failed");
}

SHA1_Digest SHA1_Hasher::finish()
{
    SHA1_Digest digest;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(m_ctx, digest.data(), &len) != 1 || len != digest.size())
        Errors::raise<CHD_Error>("SHA-1 finalisation failed");
    return digest;
}

SHA1_Digest SHA1_Hasher::digest(const uint8_t* data, size_t length)
{
    SHA1_Hasher hasher;
    hasher.update(data, length);
    return hasher.finish();
}
