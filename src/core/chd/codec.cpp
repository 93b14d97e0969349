#include "codec.hpp"
#include "codecs/cd_codec.hpp"
#include "codecs/deflate_codec.hpp"
#include "codecs/huff_codec.hpp"
#include "codecs/lzma_codec.hpp"
#include "../errors.hpp"

std::string tag_to_string(uint32_t tag)
{
    std::string out;
    for (int shift = 24; shift >= 0; shift -= 8)
    {
        char c = (char)((tag >> shift) & 0xFF);
        out += (c >= 0x20 && c < 0x7F) ? c : '?';
    }
    return out;
}

const Codec_Registry& Codec_Registry::defaults()
{
    static const Codec_Registry registry = []()
    {
        Codec_Registry r;
        r.add(CHD_CODEC_ZLIB, "Deflate", [](uint32_t)
        {
            return std::unique_ptr<CHD_Codec>(new Deflate_Codec());
        });
        r.add(CHD_CODEC_LZMA, "LZMA", [](uint32_t hunk_bytes)
        {
            return std::unique_ptr<CHD_Codec>(new LZMA_Codec(hunk_bytes));
        });
        r.add(CHD_CODEC_HUFFMAN, "Huffman", [](uint32_t)
        {
            return std::unique_ptr<CHD_Codec>(new Huff_Codec());
        });
        r.add(CHD_CODEC_CD_ZLIB, "CD Deflate", [](uint32_t)
        {
            return std::unique_ptr<CHD_Codec>(new CD_Codec(
                std::unique_ptr<CHD_Codec>(new Deflate_Codec()),
                std::unique_ptr<CHD_Codec>(new Deflate_Codec())));
        });
        r.add(CHD_CODEC_CD_LZMA, "CD LZMA", [](uint32_t hunk_bytes)
        {
            uint32_t frames = hunk_bytes / CD_FRAME_SIZE;
            return std::unique_ptr<CHD_Codec>(new CD_Codec(
                std::unique_ptr<CHD_Codec>(new LZMA_Codec(frames * CD_MAX_SECTOR_DATA)),
                std::unique_ptr<CHD_Codec>(new Deflate_Codec())));
        });
        return r;
    }();
    return registry;
}

void Codec_Registry::add(uint32_t tag, const std::string& name, Codec_Factory factory)
{
    m_codecs[tag] = Entry{name, std::move(factory)};
}

bool Codec_Registry::has(uint32_t tag) const
{
    return m_codecs.find(tag) != m_codecs.end();
}

std::string Codec_Registry::name(uint32_t tag) const
{
    auto it = m_codecs.find(tag);
    if (it == m_codecs.end())
        return tag_to_string(tag);
    return it->second.name;
}

std::unique_ptr<CHD_Codec> Codec_Registry::create(uint32_t tag, uint32_t hunk_bytes) const
{
    auto it = m_codecs.find(tag);
    if (it == m_codecs.end())
        Errors::raise<Codec_error>("no decoder registered for compressor '%s'", tag_to_string(tag).c_str());
    return it->second.factory(hunk_bytes);
}
