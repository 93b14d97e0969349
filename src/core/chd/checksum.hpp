#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

struct evp_md_ctx_st;

typedef std::array<uint8_t, 20> SHA1_Digest;

//CRC-16/CCITT, init 0xFFFF, no final xor. Used by the v5 map and v5 hunk checks.
uint16_t crc16(const uint8_t* data, size_t length);

//Standard zlib CRC-32, used by v3/v4 hunk checks
uint32_t crc32(const uint8_t* data, size_t length);

bool sha1_is_zero(const SHA1_Digest& digest);
std::string sha1_to_string(const SHA1_Digest& digest);

class SHA1_Hasher
{
    public:
        SHA1_Hasher();
        ~SHA1_Hasher();
        SHA1_Hasher(const SHA1_Hasher&) = delete;
        SHA1_Hasher& operator=(const SHA1_Hasher&) = delete;

        void update(const uint8_t* data, size_t length);
        SHA1_Digest finish();

        static SHA1_Digest digest(const uint8_t* data, size_t length);
    private:
        evp_md_ctx_st* m_ctx;
};

#endif // CHECKSUM_HPP
