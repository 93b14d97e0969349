#include "chd_header.hpp"
#include "byte_source.hpp"
#include "bytes.hpp"
#include "codec.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <cstring>

#define CHD_MAX_HUNK_BYTES (65536 * 256)

bool CHD_Header::has_parent() const
{
    if (version >= 5)
        return !sha1_is_zero(parent_sha1);
    return (flags & CHDFLAGS_HAS_PARENT) != 0;
}

bool CHD_Header::compressed_map() const
{
    return version >= 5 && compressors[0] != CHD_CODEC_NONE;
}

static void copy_sha1(SHA1_Digest& digest, const uint8_t* src)
{
    std::copy(src, src + digest.size(), digest.begin());
}

static uint32_t translate_v34_compression(uint32_t compression)
{
    switch (compression)
    {
        case V34_COMPRESSION_NONE:
            return CHD_CODEC_NONE;
        case V34_COMPRESSION_ZLIB:
        case V34_COMPRESSION_ZLIB_PLUS:
            return CHD_CODEC_ZLIB;
        default:
            Errors::raise<Format_error>("unsupported v3/v4 compression type %u", compression);
    }
}

CHD_Header CHD_Header::parse(Byte_Source& source, const Codec_Registry& codecs)
{
    uint64_t file_size = source.size();
    uint8_t raw[CHD_V5_HEADER_SIZE];

    if (file_size < 16)
        Errors::raise<Truncated_error>("file is only %llu bytes, too short for a CHD header", (unsigned long long)file_size);
    source.read_at(0, raw, 16);

    if (memcmp(raw, CHD_MAGIC, 8) != 0)
        Errors::raise<Format_error>("file is not a CHD (bad magic)");

    CHD_Header header = CHD_Header();
    header.length = get_be32(&raw[8]);
    header.version = get_be32(&raw[12]);

    if (header.version < 3 || header.version > 5)
        Errors::raise<Unsupported_version_error>("CHD version %u is not supported", header.version);

    uint32_t expected_length = 0;
    switch (header.version)
    {
        case 3:
            expected_length = CHD_V3_HEADER_SIZE;
            break;
        case 4:
            expected_length = CHD_V4_HEADER_SIZE;
            break;
        case 5:
            expected_length = CHD_V5_HEADER_SIZE;
            break;
    }
    if (header.length != expected_length)
        Errors::raise<Format_error>("v%u header claims %u bytes, expected %u", header.version, header.length, expected_length);
    if (file_size < header.length)
        Errors::raise<Truncated_error>("file ends inside the v%u header", header.version);
    source.read_at(16, raw + 16, header.length - 16);

    uint32_t total_hunks = 0;
    if (header.version == 5)
    {
        header.compressor_count = 0;
        for (int i = 0; i < CHD_MAX_COMPRESSORS; i++)
        {
            header.compressors[i] = get_be32(&raw[16 + i * 4]);
            if (header.compressors[i] != CHD_CODEC_NONE)
                header.compressor_count = i + 1;
        }
        header.logical_bytes = get_be64(&raw[32]);
        header.map_offset = get_be64(&raw[40]);
        header.meta_offset = get_be64(&raw[48]);
        header.hunk_bytes = get_be32(&raw[56]);
        header.unit_bytes = get_be32(&raw[60]);
        copy_sha1(header.raw_sha1, &raw[64]);
        copy_sha1(header.sha1, &raw[84]);
        copy_sha1(header.parent_sha1, &raw[104]);
    }
    else
    {
        header.flags = get_be32(&raw[16]);
        header.compressors[0] = translate_v34_compression(get_be32(&raw[20]));
        header.compressor_count = header.compressors[0] != CHD_CODEC_NONE ? 1 : 0;
        total_hunks = get_be32(&raw[24]);
        header.logical_bytes = get_be64(&raw[28]);
        header.meta_offset = get_be64(&raw[36]);
        header.map_offset = header.length;

        if (header.version == 3)
        {
            header.hunk_bytes = get_be32(&raw[76]);
            copy_sha1(header.sha1, &raw[80]);
            copy_sha1(header.parent_sha1, &raw[100]);
            header.raw_sha1 = header.sha1;
        }
        else
        {
            header.hunk_bytes = get_be32(&raw[44]);
            copy_sha1(header.sha1, &raw[48]);
            copy_sha1(header.parent_sha1, &raw[68]);
            copy_sha1(header.raw_sha1, &raw[88]);
        }
        header.unit_bytes = header.hunk_bytes;
    }

    if (header.hunk_bytes == 0 || header.hunk_bytes >= CHD_MAX_HUNK_BYTES)
        Errors::raise<Format_error>("invalid hunk size %u", header.hunk_bytes);
    if (header.unit_bytes == 0 || header.hunk_bytes % header.unit_bytes != 0)
        Errors::raise<Format_error>("unit size %u doesn't divide hunk size %u", header.unit_bytes, header.hunk_bytes);

    uint64_t hunk_count = (header.logical_bytes + header.hunk_bytes - 1) / header.hunk_bytes;
    if (hunk_count > 0xFFFFFFFFull)
        Errors::raise<Format_error>("logical size %llu needs too many hunks", (unsigned long long)header.logical_bytes);
    if (header.version < 5 && hunk_count != total_hunks)
    {
        Errors::raise<Format_error>("header declares %u hunks but %llu bytes need %llu",
                                    total_hunks, (unsigned long long)header.logical_bytes, (unsigned long long)hunk_count);
    }
    header.hunk_count = (uint32_t)hunk_count;
    header.unit_count = (header.logical_bytes + header.unit_bytes - 1) / header.unit_bytes;

    // compressor list: no duplicates, and we need a decoder for each one
    for (uint32_t i = 0; i < header.compressor_count; i++)
    {
        uint32_t tag = header.compressors[i];
        if (tag == CHD_CODEC_NONE)
            continue;
        for (uint32_t j = 0; j < i; j++)
        {
            if (header.compressors[j] == tag)
                Errors::raise<Format_error>("compressor '%s' is listed twice", tag_to_string(tag).c_str());
        }
        if (!codecs.has(tag))
            Errors::raise<Format_error>("unsupported compressor '%s'", tag_to_string(tag).c_str());
    }

    uint64_t map_bytes;
    if (header.version < 5)
        map_bytes = (uint64_t)header.hunk_count * CHD_V34_MAP_ENTRY_SIZE + CHD_V34_MAP_ENTRY_SIZE;
    else if (header.compressed_map())
        map_bytes = CHD_V5_MAP_HEADER_SIZE;
    else
        map_bytes = (uint64_t)header.hunk_count * CHD_V5_UNCOMPRESSED_MAP_ENTRY_SIZE;

    if (header.map_offset > file_size || map_bytes > file_size - header.map_offset)
    {
        Errors::raise<Truncated_error>("hunk map at $%llX (%llu bytes) lies outside the %llu byte file",
                                       (unsigned long long)header.map_offset, (unsigned long long)map_bytes,
                                       (unsigned long long)file_size);
    }

    dh_log->chd->debug("v{} header: {} hunks of {} bytes, {} logical bytes, parent: {}",
                          header.version, header.hunk_count, header.hunk_bytes,
                          header.logical_bytes, header.has_parent() ? sha1_to_string(header.parent_sha1) : "none");
    return header;
}
