#ifndef CHD_HEADER_HPP
#define CHD_HEADER_HPP
#include <cstdint>
#include "checksum.hpp"

class Byte_Source;
class Codec_Registry;

#define CHD_MAGIC "MComprHD"
#define CHD_MAX_COMPRESSORS 4

#define CHD_V3_HEADER_SIZE 120
#define CHD_V4_HEADER_SIZE 108
#define CHD_V5_HEADER_SIZE 124

#define CHD_V34_MAP_ENTRY_SIZE 16
#define CHD_V5_UNCOMPRESSED_MAP_ENTRY_SIZE 4
#define CHD_V5_COMPRESSED_MAP_ENTRY_SIZE 12
#define CHD_V5_MAP_HEADER_SIZE 16

#define CHDFLAGS_HAS_PARENT 0x00000001

enum CHD_V34_COMPRESSION
{
    V34_COMPRESSION_NONE = 0,
    V34_COMPRESSION_ZLIB = 1,
    V34_COMPRESSION_ZLIB_PLUS = 2,
    V34_COMPRESSION_AV = 3
};

struct CHD_Header
{
    uint32_t length;
    uint32_t version;
    uint32_t flags;

    //Four-character codec tags, unused slots are 0. v3/v4 images get theirs translated.
    uint32_t compressors[CHD_MAX_COMPRESSORS];
    uint32_t compressor_count;

    uint64_t logical_bytes;
    uint64_t map_offset;
    uint64_t meta_offset;
    uint32_t hunk_bytes;
    uint32_t unit_bytes;
    uint32_t hunk_count;
    uint64_t unit_count;

    SHA1_Digest raw_sha1;
    SHA1_Digest sha1;
    SHA1_Digest parent_sha1;

    bool has_parent() const;
    bool compressed_map() const;

    //Validates everything that can be checked without looking at the map
    static CHD_Header parse(Byte_Source& source, const Codec_Registry& codecs);
};

#endif // CHD_HEADER_HPP
