#include "hunk_map.hpp"
#include "byte_source.hpp"
#include "bytes.hpp"
#include "checksum.hpp"
#include "chd_header.hpp"
#include "codec.hpp"
#include "huffman.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <cstring>

Hunk_Map Hunk_Map::load(const CHD_Header& header, Byte_Source& source)
{
    Hunk_Map map;
    if (header.version < 5)
        map.load_v34(header, source);
    else if (header.compressed_map())
        map.load_v5_compressed(header, source);
    else
        map.load_v5_uncompressed(header, source);

    map.validate(header, source.size());
    dh_log->map->debug("loaded {} map entries", map.size());
    return map;
}

void Hunk_Map::load_v34(const CHD_Header& header, Byte_Source& source)
{
    std::vector<uint8_t> raw = source.read_at(header.map_offset,
                                              (size_t)header.hunk_count * CHD_V34_MAP_ENTRY_SIZE + CHD_V34_MAP_ENTRY_SIZE);
    m_entries.resize(header.hunk_count);

    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++)
    {
        const uint8_t* base = &raw[(size_t)hunk * CHD_V34_MAP_ENTRY_SIZE];
        Hunk_Entry& entry = m_entries[hunk];

        entry.offset = get_be64(&base[0]);
        entry.check = get_be32(&base[8]);
        entry.length = get_be16(&base[12]) | ((uint32_t)base[14] << 16);
        entry.codec = 0;
        uint8_t flags = base[15];
        entry.check_kind = (flags & V34_MAP_ENTRY_FLAG_NO_CRC) ? Check_Kind::None : Check_Kind::CRC32;

        switch (flags & V34_MAP_ENTRY_FLAG_TYPE_MASK)
        {
            case V34_MAP_ENTRY_TYPE_COMPRESSED:
                entry.kind = Hunk_Kind::Compressed;
                break;
            case V34_MAP_ENTRY_TYPE_UNCOMPRESSED:
                entry.kind = Hunk_Kind::Uncompressed;
                break;
            case V34_MAP_ENTRY_TYPE_MINI:
                entry.kind = Hunk_Kind::Mini;
                break;
            case V34_MAP_ENTRY_TYPE_SELF_HUNK:
                entry.kind = Hunk_Kind::Self_Copy;
                entry.check_kind = Check_Kind::None;
                break;
            case V34_MAP_ENTRY_TYPE_PARENT_HUNK:
                entry.kind = Hunk_Kind::Parent_Copy;
                entry.check_kind = Check_Kind::None;
                break;
            default:
                Errors::raise<Index_corrupt_error>("hunk %u has unknown map entry type %u", hunk, flags & V34_MAP_ENTRY_FLAG_TYPE_MASK);
        }
    }

    const uint8_t* cookie = &raw[(size_t)header.hunk_count * CHD_V34_MAP_ENTRY_SIZE];
    if (memcmp(cookie, V34_END_OF_LIST_COOKIE, CHD_V34_MAP_ENTRY_SIZE) != 0)
        Errors::raise<Index_corrupt_error>("hunk map is missing its end-of-list marker");
}

void Hunk_Map::load_v5_uncompressed(const CHD_Header& header, Byte_Source& source)
{
    std::vector<uint8_t> raw = source.read_at(header.map_offset,
                                              (size_t)header.hunk_count * CHD_V5_UNCOMPRESSED_MAP_ENTRY_SIZE);
    m_entries.resize(header.hunk_count);
    uint32_t units_per_hunk = header.hunk_bytes / header.unit_bytes;

    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++)
    {
        Hunk_Entry& entry = m_entries[hunk];
        uint64_t block = get_be32(&raw[(size_t)hunk * CHD_V5_UNCOMPRESSED_MAP_ENTRY_SIZE]);

        entry.codec = 0;
        entry.check = 0;
        entry.check_kind = Check_Kind::None;
        entry.length = header.hunk_bytes;

        if (block != 0)
        {
            entry.kind = Hunk_Kind::Uncompressed;
            entry.offset = block * header.hunk_bytes;
        }
        else if (header.has_parent())
        {
            // unwritten hunks in a child come from the same place in the parent
            entry.kind = Hunk_Kind::Parent_Copy;
            entry.offset = (uint64_t)hunk * units_per_hunk;
        }
        else
        {
            entry.kind = Hunk_Kind::Mini;
            entry.offset = 0;
        }
    }
}

void Hunk_Map::load_v5_compressed(const CHD_Header& header, Byte_Source& source)
{
    uint8_t map_header[CHD_V5_MAP_HEADER_SIZE];
    source.read_at(header.map_offset, map_header, CHD_V5_MAP_HEADER_SIZE);

    uint32_t map_bytes = get_be32(&map_header[0]);
    uint64_t first_offset = get_be48(&map_header[4]);
    uint16_t map_crc = get_be16(&map_header[10]);
    uint8_t length_bits = map_header[12];
    uint8_t self_bits = map_header[13];
    uint8_t parent_bits = map_header[14];

    if (length_bits > 32 || self_bits > 32 || parent_bits > 32)
        Errors::raise<Index_corrupt_error>("map header has impossible field widths (%u/%u/%u)", length_bits, self_bits, parent_bits);

    uint64_t map_start = header.map_offset + CHD_V5_MAP_HEADER_SIZE;
    if (map_start > source.size() || map_bytes > source.size() - map_start)
    {
        Errors::raise<Truncated_error>("compressed hunk map ($%llX, %u bytes) runs past the end of the file",
                                       (unsigned long long)map_start, map_bytes);
    }

    //Every 3 symbols (at least a bit each) describe at most 1 + 2 + 16 + 255 hunks
    uint64_t max_hunks = ((uint64_t)map_bytes * 8 / 3 + 1) * V5_MAX_HUNKS_PER_RLE;
    if (header.hunk_count > max_hunks)
    {
        Errors::raise<Index_corrupt_error>("a %u byte compressed map can't describe %u hunks",
                                           map_bytes, header.hunk_count);
    }

    std::vector<uint8_t> compressed = source.read_at(map_start, map_bytes);

    Bit_Reader bits(compressed.data(), map_bytes);
    Huffman_Decoder decoder(16, 8);
    if (!decoder.import_tree_rle(bits))
        Errors::raise<Index_corrupt_error>("hunk map has an invalid huffman tree");

    // first pass: the compression type of every hunk, run-length coded
    std::vector<uint8_t> rawmap((size_t)header.hunk_count * CHD_V5_COMPRESSED_MAP_ENTRY_SIZE);
    m_entries.resize(header.hunk_count);
    uint32_t repcount = 0;
    uint8_t lastcomp = 0;
    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++)
    {
        uint8_t* entry = &rawmap[(size_t)hunk * CHD_V5_COMPRESSED_MAP_ENTRY_SIZE];
        if (repcount > 0)
        {
            entry[0] = lastcomp;
            repcount--;
            continue;
        }

        uint8_t val = (uint8_t)decoder.decode_one(bits);
        if (val == COMPRESSION_RLE_SMALL)
        {
            entry[0] = lastcomp;
            repcount = 2 + decoder.decode_one(bits);
        }
        else if (val == COMPRESSION_RLE_LARGE)
        {
            entry[0] = lastcomp;
            repcount = 2 + 16 + (decoder.decode_one(bits) << 4);
            repcount += decoder.decode_one(bits);
        }
        else
            entry[0] = lastcomp = val;
    }

    // second pass: lengths, offsets and CRCs
    uint64_t cur_offset = first_offset;
    uint64_t last_self = 0;
    uint64_t last_parent = 0;
    uint32_t units_per_hunk = header.hunk_bytes / header.unit_bytes;
    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++)
    {
        uint8_t* entry = &rawmap[(size_t)hunk * CHD_V5_COMPRESSED_MAP_ENTRY_SIZE];
        uint64_t offset = cur_offset;
        uint32_t length = 0;
        uint16_t crc = 0;

        switch (entry[0])
        {
            case COMPRESSION_TYPE_0:
            case COMPRESSION_TYPE_1:
            case COMPRESSION_TYPE_2:
            case COMPRESSION_TYPE_3:
                length = bits.read(length_bits);
                cur_offset += length;
                crc = (uint16_t)bits.read(16);
                break;
            case COMPRESSION_NONE:
                length = header.hunk_bytes;
                cur_offset += length;
                crc = (uint16_t)bits.read(16);
                break;
            case COMPRESSION_SELF:
                last_self = offset = bits.read(self_bits);
                break;
            case COMPRESSION_PARENT:
                offset = bits.read(parent_bits);
                last_parent = offset;
                break;
            case COMPRESSION_SELF_1:
                last_self++;
                // fall through
            case COMPRESSION_SELF_0:
                entry[0] = COMPRESSION_SELF;
                offset = last_self;
                break;
            case COMPRESSION_PARENT_SELF:
                entry[0] = COMPRESSION_PARENT;
                last_parent = offset = ((uint64_t)hunk * header.hunk_bytes) / header.unit_bytes;
                break;
            case COMPRESSION_PARENT_1:
                last_parent += units_per_hunk;
                // fall through
            case COMPRESSION_PARENT_0:
                entry[0] = COMPRESSION_PARENT;
                offset = last_parent;
                break;
            default:
                Errors::raise<Index_corrupt_error>("hunk %u has unknown compression code %u", hunk, entry[0]);
        }

        put_be24(&entry[1], length);
        put_be48(&entry[4], offset);
        put_be16(&entry[10], crc);
    }

    if (bits.overflow())
        Errors::raise<Index_corrupt_error>("compressed hunk map is truncated");

    uint16_t actual_crc = crc16(rawmap.data(), rawmap.size());
    if (actual_crc != map_crc)
        Errors::raise<Index_corrupt_error>("hunk map CRC mismatch (stored $%04X, computed $%04X)", map_crc, actual_crc);

    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++)
    {
        const uint8_t* raw = &rawmap[(size_t)hunk * CHD_V5_COMPRESSED_MAP_ENTRY_SIZE];
        Hunk_Entry& entry = m_entries[hunk];
        entry.codec = 0;
        entry.length = get_be24(&raw[1]);
        entry.offset = get_be48(&raw[4]);
        entry.check = get_be16(&raw[10]);
        entry.check_kind = Check_Kind::CRC16;

        switch (raw[0])
        {
            case COMPRESSION_NONE:
                entry.kind = Hunk_Kind::Uncompressed;
                break;
            case COMPRESSION_SELF:
                entry.kind = Hunk_Kind::Self_Copy;
                entry.check_kind = Check_Kind::None;
                break;
            case COMPRESSION_PARENT:
                entry.kind = Hunk_Kind::Parent_Copy;
                entry.check_kind = Check_Kind::None;
                break;
            default:
                entry.kind = Hunk_Kind::Compressed;
                entry.codec = raw[0];
                break;
        }
    }
}

void Hunk_Map::validate(const CHD_Header& header, uint64_t file_size) const
{
    for (uint32_t hunk = 0; hunk < m_entries.size(); hunk++)
    {
        const Hunk_Entry& entry = m_entries[hunk];
        switch (entry.kind)
        {
            case Hunk_Kind::Compressed:
                if (entry.codec >= header.compressor_count || header.compressors[entry.codec] == CHD_CODEC_NONE)
                    Errors::raise<Index_corrupt_error>("hunk %u uses compressor slot %u, which is empty", hunk, entry.codec);
                // fall through
            case Hunk_Kind::Uncompressed:
                if (entry.offset > file_size || entry.length > file_size - entry.offset)
                {
                    Errors::raise<Index_corrupt_error>("hunk %u data ($%llX, %u bytes) lies outside the file",
                                                       hunk, (unsigned long long)entry.offset, entry.length);
                }
                break;
            case Hunk_Kind::Self_Copy:
                if (entry.offset >= header.hunk_count)
                    Errors::raise<Index_corrupt_error>("hunk %u copies hunk %llu, past the end", hunk, (unsigned long long)entry.offset);
                break;
            case Hunk_Kind::Parent_Copy:
                if (!header.has_parent())
                    Errors::raise<Index_corrupt_error>("hunk %u references a parent, but the image has none", hunk);
                break;
            case Hunk_Kind::Mini:
                break;
        }
    }
}

uint64_t Hunk_Map::parent_units_needed(uint32_t units_per_hunk) const
{
    uint64_t needed = 0;
    for (const Hunk_Entry& entry : m_entries)
    {
        if (entry.kind == Hunk_Kind::Parent_Copy && entry.offset + units_per_hunk > needed)
            needed = entry.offset + units_per_hunk;
    }
    return needed;
}

void Hunk_Map::expand_mini(uint64_t literal, uint8_t* dest, uint32_t hunk_bytes)
{
    uint8_t pattern[8];
    put_be64(pattern, literal);
    for (uint32_t i = 0; i < hunk_bytes; i++)
        dest[i] = pattern[i & 7];
}
