#ifndef HUNK_MAP_HPP
#define HUNK_MAP_HPP
#include <cstdint>
#include <vector>

class Byte_Source;
struct CHD_Header;

enum class Hunk_Kind
{
    Compressed,     // codec slot + data at offset/length
    Uncompressed,   // hunk_bytes of raw data at offset
    Self_Copy,      // same data as hunk number `offset`
    Parent_Copy,    // hunk_bytes from the parent starting at unit `offset`
    Mini            // `offset` is an 8 byte literal repeated over the hunk
};

enum class Check_Kind
{
    None,
    CRC16,
    CRC32
};

struct Hunk_Entry
{
    Hunk_Kind kind;
    uint8_t codec;
    uint32_t length;
    uint64_t offset;
    uint32_t check;
    Check_Kind check_kind;
};

//v5 map codes, as stored in the compressed map stream
enum V5_COMPRESSION
{
    COMPRESSION_TYPE_0 = 0,
    COMPRESSION_TYPE_1 = 1,
    COMPRESSION_TYPE_2 = 2,
    COMPRESSION_TYPE_3 = 3,
    COMPRESSION_NONE = 4,
    COMPRESSION_SELF = 5,
    COMPRESSION_PARENT = 6,
    COMPRESSION_RLE_SMALL = 7,
    COMPRESSION_RLE_LARGE = 8,
    COMPRESSION_SELF_0 = 9,
    COMPRESSION_SELF_1 = 10,
    COMPRESSION_PARENT_SELF = 11,
    COMPRESSION_PARENT_0 = 12,
    COMPRESSION_PARENT_1 = 13
};

//v3/v4 map entry types (low nibble of the flags byte)
enum V34_MAP_ENTRY
{
    V34_MAP_ENTRY_TYPE_INVALID = 0,
    V34_MAP_ENTRY_TYPE_COMPRESSED = 1,
    V34_MAP_ENTRY_TYPE_UNCOMPRESSED = 2,
    V34_MAP_ENTRY_TYPE_MINI = 3,
    V34_MAP_ENTRY_TYPE_SELF_HUNK = 4,
    V34_MAP_ENTRY_TYPE_PARENT_HUNK = 5
};

#define V34_MAP_ENTRY_FLAG_TYPE_MASK 0x0F
#define V34_MAP_ENTRY_FLAG_NO_CRC 0x10
#define V34_END_OF_LIST_COOKIE "EndOfListCookie"
#define V5_MAX_HUNKS_PER_RLE 274

class Hunk_Map
{
    public:
        //Reads, decompresses if needed, and validates the map. Throws Index_corrupt_error.
        static Hunk_Map load(const CHD_Header& header, Byte_Source& source);

        const Hunk_Entry& operator[](uint32_t hunk) const { return m_entries[hunk]; }
        uint32_t size() const { return (uint32_t)m_entries.size(); }

        //Highest parent unit referenced plus the hunk's worth of units, 0 when nothing uses the parent
        uint64_t parent_units_needed(uint32_t units_per_hunk) const;

        //Fills a hunk with the mini literal, big-endian, repeated every 8 bytes
        static void expand_mini(uint64_t literal, uint8_t* dest, uint32_t hunk_bytes);
    private:
        std::vector<Hunk_Entry> m_entries;

        void load_v34(const CHD_Header& header, Byte_Source& source);
        void load_v5_uncompressed(const CHD_Header& header, Byte_Source& source);
        void load_v5_compressed(const CHD_Header& header, Byte_Source& source);
        void validate(const CHD_Header& header, uint64_t file_size) const;
};

#endif // HUNK_MAP_HPP
