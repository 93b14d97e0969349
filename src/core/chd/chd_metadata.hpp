#ifndef CHD_METADATA_HPP
#define CHD_METADATA_HPP
#include <cstdint>
#include <string>
#include <vector>
#include "codec.hpp"

class Byte_Source;
struct CHD_Header;

#define CHD_METADATA_HEADER_SIZE 16
#define CHD_MDFLAGS_CHECKSUM 0x01

constexpr uint32_t CHD_METADATA_TAG_WILDCARD = 0;
constexpr uint32_t HARD_DISK_METADATA_TAG = CHD_MAKE_TAG('G', 'D', 'D', 'D');
constexpr uint32_t CDROM_OLD_METADATA_TAG = CHD_MAKE_TAG('C', 'H', 'C', 'D');
constexpr uint32_t CDROM_TRACK_METADATA_TAG = CHD_MAKE_TAG('C', 'H', 'T', 'R');
constexpr uint32_t CDROM_TRACK_METADATA2_TAG = CHD_MAKE_TAG('C', 'H', 'T', '2');
constexpr uint32_t GDROM_TRACK_METADATA_TAG = CHD_MAKE_TAG('C', 'H', 'G', 'D');

#define CDROM_TRACK_METADATA_FORMAT "TRACK:%d TYPE:%s SUBTYPE:%s FRAMES:%d"
#define CDROM_TRACK_METADATA2_FORMAT "TRACK:%d TYPE:%s SUBTYPE:%s FRAMES:%d PREGAP:%d PGTYPE:%s PGSUB:%s POSTGAP:%d"

struct Metadata_Entry
{
    uint32_t tag;
    uint8_t flags;
    uint64_t offset;//of the entry header in the file
    std::vector<uint8_t> data;

    std::string text() const;//data up to the first NUL
};

class CHD_Metadata
{
    public:
        //Walks the whole list. Loops and entries outside the file are Format_error.
        static CHD_Metadata load(const CHD_Header& header, Byte_Source& source);

        const std::vector<Metadata_Entry>& entries() const { return m_entries; }

        //index counts only entries with a matching tag; CHD_METADATA_TAG_WILDCARD matches all.
        //Throws Metadata_not_found_error.
        const Metadata_Entry& find(uint32_t tag, uint32_t index = 0) const;
        bool has(uint32_t tag, uint32_t index = 0) const;
        uint32_t count(uint32_t tag) const;
    private:
        std::vector<Metadata_Entry> m_entries;

        const Metadata_Entry* lookup(uint32_t tag, uint32_t index) const;
};

#endif // CHD_METADATA_HPP
