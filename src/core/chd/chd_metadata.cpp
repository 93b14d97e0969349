#include "chd_metadata.hpp"
#include "byte_source.hpp"
#include "bytes.hpp"
#include "chd_header.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <unordered_set>

std::string Metadata_Entry::text() const
{
    auto end = std::find(data.begin(), data.end(), 0);
    return std::string(data.begin(), end);
}

CHD_Metadata CHD_Metadata::load(const CHD_Header& header, Byte_Source& source)
{
    CHD_Metadata metadata;
    uint64_t file_size = source.size();
    std::unordered_set<uint64_t> visited;

    uint64_t offset = header.meta_offset;
    while (offset != 0)
    {
        if (!visited.insert(offset).second)
            Errors::raise<Format_error>("metadata list loops back to $%llX", (unsigned long long)offset);
        if (offset > file_size || CHD_METADATA_HEADER_SIZE > file_size - offset)
            Errors::raise<Format_error>("metadata entry at $%llX lies outside the file", (unsigned long long)offset);

        uint8_t raw[CHD_METADATA_HEADER_SIZE];
        source.read_at(offset, raw, CHD_METADATA_HEADER_SIZE);

        Metadata_Entry entry;
        entry.tag = get_be32(&raw[0]);
        entry.flags = raw[4];
        entry.offset = offset;
        uint32_t length = get_be24(&raw[5]);
        uint64_t next = get_be64(&raw[8]);

        uint64_t data_offset = offset + CHD_METADATA_HEADER_SIZE;
        if (length > file_size - data_offset)
        {
            Errors::raise<Format_error>("metadata '%s' at $%llX runs past the end of the file",
                                        tag_to_string(entry.tag).c_str(), (unsigned long long)offset);
        }
        entry.data = source.read_at(data_offset, length);

        dh_log->chd->trace("metadata '{}' flags ${:02X}, {} bytes", tag_to_string(entry.tag), entry.flags, length);
        metadata.m_entries.push_back(std::move(entry));
        offset = next;
    }
    return metadata;
}

const Metadata_Entry* CHD_Metadata::lookup(uint32_t tag, uint32_t index) const
{
    for (const Metadata_Entry& entry : m_entries)
    {
        if (tag != CHD_METADATA_TAG_WILDCARD && entry.tag != tag)
            continue;
        if (index == 0)
            return &entry;
        index--;
    }
    return nullptr;
}

const Metadata_Entry& CHD_Metadata::find(uint32_t tag, uint32_t index) const
{
    const Metadata_Entry* entry = lookup(tag, index);
    if (!entry)
        Errors::raise<Metadata_not_found_error>("no metadata '%s' with index %u", tag_to_string(tag).c_str(), index);
    return *entry;
}

bool CHD_Metadata::has(uint32_t tag, uint32_t index) const
{
    return lookup(tag, index) != nullptr;
}

uint32_t CHD_Metadata::count(uint32_t tag) const
{
    uint32_t total = 0;
    for (const Metadata_Entry& entry : m_entries)
    {
        if (tag == CHD_METADATA_TAG_WILDCARD || entry.tag == tag)
            total++;
    }
    return total;
}
