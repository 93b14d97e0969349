#ifndef CHD_FILE_HPP
#define CHD_FILE_HPP
#include <memory>
#include <string>
#include <vector>
#include "chd_header.hpp"
#include "chd_metadata.hpp"
#include "chd_options.hpp"
#include "codec.hpp"
#include "hunk_cache.hpp"
#include "hunk_map.hpp"

class Byte_Source;
class Hunk_Decoder;
class Parent_Locator;

/*
One open CHD image, plus its parents.
Everything but the cache is fixed once open() returns, so reads may come from
any number of threads when CHD_Options::multithreaded is set.
*/
class CHD_File
{
    public:
        //Parents are resolved before this returns; a missing parent fails the open
        static std::unique_ptr<CHD_File> open(const std::string& path, const CHD_Options& options = CHD_Options(),
                                              Parent_Locator* locator = nullptr);
        static std::unique_ptr<CHD_File> open(std::unique_ptr<Byte_Source> source, const CHD_Options& options = CHD_Options(),
                                              Parent_Locator* locator = nullptr);
        ~CHD_File();

        //Whole range or an exception, never part of it
        std::vector<uint8_t> read(uint64_t offset, uint64_t length);
        void read_hunk(uint32_t hunk, uint8_t* dest);

        uint32_t version() const { return m_header.version; }
        uint32_t hunk_bytes() const { return m_header.hunk_bytes; }
        uint32_t unit_bytes() const { return m_header.unit_bytes; }
        uint32_t hunk_count() const { return m_header.hunk_count; }
        uint64_t logical_bytes() const { return m_header.logical_bytes; }

        //Identity used for parent matching and cycle checks
        const SHA1_Digest& sha1() const { return m_header.sha1; }
        const SHA1_Digest& raw_sha1() const { return m_header.raw_sha1; }
        const SHA1_Digest& parent_sha1() const { return m_header.parent_sha1; }
        bool has_parent() const { return m_header.has_parent(); }

        const CHD_Header& header() const { return m_header; }
        const Hunk_Map& map() const { return m_map; }
        const CHD_Metadata& metadata() const { return m_metadata; }
        const Codec_Registry& codecs() const { return m_codecs; }
        CHD_File* parent() const { return m_parent.get(); }
        Hunk_Cache& cache() { return m_cache; }

        //Copies from the hunk space (which may run past logical_bytes on the last hunk).
        //Used to serve a child's parent references.
        void copy_span(uint64_t offset, uint8_t* dest, size_t length, bool cached);
    private:
        friend class CHD_Verifier;
        friend class Parent_Resolver;

        std::unique_ptr<Byte_Source> m_source;
        CHD_Header m_header;
        Hunk_Map m_map;
        CHD_Metadata m_metadata;
        Codec_Registry m_codecs;
        std::unique_ptr<CHD_File> m_parent;
        Hunk_Cache m_cache;
        std::unique_ptr<Hunk_Decoder> m_decoder;

        CHD_File(std::unique_ptr<Byte_Source> source, const CHD_Header& header, Hunk_Map map,
                 CHD_Metadata metadata, const Codec_Registry& codecs, std::unique_ptr<CHD_File> parent,
                 const CHD_Options& options);

        static std::unique_ptr<CHD_File> open_chained(std::unique_ptr<Byte_Source> source, const CHD_Options& options,
                                                      Parent_Locator* locator, std::vector<SHA1_Digest>& chain);

        Hunk_Buffer fetch(uint32_t hunk);
};

#endif // CHD_FILE_HPP
