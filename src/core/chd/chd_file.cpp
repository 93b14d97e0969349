#include "chd_file.hpp"
#include "byte_source.hpp"
#include "hunk_decoder.hpp"
#include "parent_locator.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <cstring>

CHD_File::CHD_File(std::unique_ptr<Byte_Source> source, const CHD_Header& header, Hunk_Map map,
                   CHD_Metadata metadata, const Codec_Registry& codecs, std::unique_ptr<CHD_File> parent,
                   const CHD_Options& options) :
    m_source(std::move(source)),
    m_header(header),
    m_map(std::move(map)),
    m_metadata(std::move(metadata)),
    m_codecs(codecs),
    m_parent(std::move(parent)),
    m_cache(std::min(options.cache_hunks, header.hunk_count), header.hunk_bytes, options.multithreaded)
{
    m_decoder = std::unique_ptr<Hunk_Decoder>(new Hunk_Decoder(m_header, m_map, *m_source, m_codecs,
                                                               m_cache, m_parent.get(), options.verify_hunks));
}

CHD_File::~CHD_File()
{

}

std::unique_ptr<CHD_File> CHD_File::open(const std::string& path, const CHD_Options& options, Parent_Locator* locator)
{
    dh_log->chd->info("opening {}", path);
    return open(std::unique_ptr<Byte_Source>(new File_Source(path)), options, locator);
}

std::unique_ptr<CHD_File> CHD_File::open(std::unique_ptr<Byte_Source> source, const CHD_Options& options,
                                         Parent_Locator* locator)
{
    std::vector<SHA1_Digest> chain;
    return open_chained(std::move(source), options, locator, chain);
}

std::unique_ptr<CHD_File> CHD_File::open_chained(std::unique_ptr<Byte_Source> source, const CHD_Options& options,
                                                 Parent_Locator* locator, std::vector<SHA1_Digest>& chain)
{
    const Codec_Registry& codecs = options.codecs ? *options.codecs : Codec_Registry::defaults();

    CHD_Header header = CHD_Header::parse(*source, codecs);
    Hunk_Map map = Hunk_Map::load(header, *source);
    CHD_Metadata metadata = CHD_Metadata::load(header, *source);

    chain.push_back(header.sha1);
    Parent_Resolver resolver(locator, options);
    std::unique_ptr<CHD_File> parent = resolver.resolve(header, map, chain);

    return std::unique_ptr<CHD_File>(new CHD_File(std::move(source), header, std::move(map), std::move(metadata),
                                                  codecs, std::move(parent), options));
}

Hunk_Buffer CHD_File::fetch(uint32_t hunk)
{
    return m_cache.fetch(hunk, [this, hunk](uint8_t* dest) { m_decoder->decode(hunk, dest, true); });
}

std::vector<uint8_t> CHD_File::read(uint64_t offset, uint64_t length)
{
    uint64_t logical = m_header.logical_bytes;
    if (offset > logical || length > logical - offset)
    {
        Errors::raise<Out_of_range_error>("read of %llu bytes at $%llX is past the end ($%llX)",
                                          (unsigned long long)length, (unsigned long long)offset,
                                          (unsigned long long)logical);
    }

    std::vector<uint8_t> output(length);
    if (length == 0)
        return output;

    uint32_t hunk_bytes = m_header.hunk_bytes;
    uint32_t first = (uint32_t)(offset / hunk_bytes);
    uint32_t last = (uint32_t)((offset + length - 1) / hunk_bytes);

    uint64_t written = 0;
    for (uint32_t hunk = first; hunk <= last; hunk++)
    {
        Hunk_Buffer buffer = fetch(hunk);

        uint64_t hunk_start = (uint64_t)hunk * hunk_bytes;
        uint32_t local = (uint32_t)(std::max(offset, hunk_start) - hunk_start);
        uint64_t count = std::min<uint64_t>(hunk_bytes - local, length - written);
        memcpy(&output[written], buffer->data() + local, count);
        written += count;
    }
    return output;
}

void CHD_File::read_hunk(uint32_t hunk, uint8_t* dest)
{
    if (hunk >= m_header.hunk_count)
        Errors::raise<Out_of_range_error>("hunk %u is past the last hunk (%u)", hunk, m_header.hunk_count);

    Hunk_Buffer buffer = fetch(hunk);
    memcpy(dest, buffer->data(), m_header.hunk_bytes);
}

void CHD_File::copy_span(uint64_t offset, uint8_t* dest, size_t length, bool cached)
{
    uint32_t hunk_bytes = m_header.hunk_bytes;
    uint64_t space = (uint64_t)m_header.hunk_count * hunk_bytes;
    if (offset > space || length > space - offset)
    {
        Errors::raise<Index_corrupt_error>("parent read of %zu bytes at $%llX is outside its %llu byte hunk space",
                                           length, (unsigned long long)offset, (unsigned long long)space);
    }

    std::vector<uint8_t> scratch;
    size_t written = 0;
    while (written < length)
    {
        uint64_t pos = offset + written;
        uint32_t hunk = (uint32_t)(pos / hunk_bytes);
        uint32_t local = (uint32_t)(pos % hunk_bytes);
        size_t count = std::min<size_t>(hunk_bytes - local, length - written);

        if (cached)
        {
            Hunk_Buffer buffer = fetch(hunk);
            memcpy(dest + written, buffer->data() + local, count);
        }
        else
        {
            scratch.resize(hunk_bytes);
            m_decoder->decode(hunk, scratch.data(), false);
            memcpy(dest + written, scratch.data() + local, count);
        }
        written += count;
    }
}
