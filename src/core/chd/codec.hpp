#ifndef CODEC_HPP
#define CODEC_HPP
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

constexpr uint32_t CHD_MAKE_TAG(char a, char b, char c, char d)
{
    return
        ((uint32_t)(unsigned char)a << 24) |
        ((uint32_t)(unsigned char)b << 16) |
        ((uint32_t)(unsigned char)c << 8) |
        ((uint32_t)(unsigned char)d << 0);
}

constexpr uint32_t CHD_CODEC_NONE = 0;
constexpr uint32_t CHD_CODEC_ZLIB = CHD_MAKE_TAG('z', 'l', 'i', 'b');
constexpr uint32_t CHD_CODEC_LZMA = CHD_MAKE_TAG('l', 'z', 'm', 'a');
constexpr uint32_t CHD_CODEC_HUFFMAN = CHD_MAKE_TAG('h', 'u', 'f', 'f');
constexpr uint32_t CHD_CODEC_FLAC = CHD_MAKE_TAG('f', 'l', 'a', 'c');
constexpr uint32_t CHD_CODEC_ZSTD = CHD_MAKE_TAG('z', 's', 't', 'd');
constexpr uint32_t CHD_CODEC_CD_ZLIB = CHD_MAKE_TAG('c', 'd', 'z', 'l');
constexpr uint32_t CHD_CODEC_CD_LZMA = CHD_MAKE_TAG('c', 'd', 'l', 'z');
constexpr uint32_t CHD_CODEC_CD_FLAC = CHD_MAKE_TAG('c', 'd', 'f', 'l');
constexpr uint32_t CHD_CODEC_CD_ZSTD = CHD_MAKE_TAG('c', 'd', 'z', 's');
constexpr uint32_t CHD_CODEC_AVHUFF = CHD_MAKE_TAG('a', 'v', 'h', 'u');

std::string tag_to_string(uint32_t tag);

//One decoder for one compression method. Instances are not shared between threads.
class CHD_Codec
{
    public:
        virtual ~CHD_Codec() {}

        //Must produce exactly dest_len bytes or throw Codec_error.
        //context is the previous hunk's decoded data when needs_context() is true, null otherwise.
        virtual void decompress(const uint8_t* src, uint32_t src_len,
                                uint8_t* dest, uint32_t dest_len, const uint8_t* context) = 0;

        virtual bool needs_context() const { return false; }
};

typedef std::function<std::unique_ptr<CHD_Codec>(uint32_t hunk_bytes)> Codec_Factory;

class Codec_Registry
{
    public:
        //zlib, lzma, huff, cdzl and cdlz
        static const Codec_Registry& defaults();

        void add(uint32_t tag, const std::string& name, Codec_Factory factory);
        bool has(uint32_t tag) const;
        std::string name(uint32_t tag) const;
        std::unique_ptr<CHD_Codec> create(uint32_t tag, uint32_t hunk_bytes) const;
    private:
        struct Entry
        {
            std::string name;
            Codec_Factory factory;
        };
        std::map<uint32_t, Entry> m_codecs;
};

#endif // CODEC_HPP
