#ifndef TEST_IMAGE_HPP
#define TEST_IMAGE_HPP
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../../chd/byte_source.hpp"
#include "../../chd/checksum.hpp"
#include "../../chd/hunk_map.hpp"

//Raw deflate made of stored blocks, so every input byte appears as-is in the output
std::vector<uint8_t> stored_deflate(const std::vector<uint8_t>& data);

//Real deflate through libdeflate
std::vector<uint8_t> libdeflate_compress_buffer(const std::vector<uint8_t>& data, int level = 6);

//hunk_bytes bytes that differ per seed
std::vector<uint8_t> pattern_hunk(uint32_t hunk_bytes, uint32_t seed);

/*
Writes small but complete CHD images in memory: header, map (v3/v4 records,
v5 uncompressed or v5 huffman-compressed), hunk data and metadata, with every
CRC and SHA-1 filled in from the decoded data the caller describes.
*/
class Test_Image
{
    public:
        Test_Image(uint32_t version, uint32_t hunk_bytes, uint32_t unit_bytes = 0);

        //v5 compressor slots; v3/v4 only look at the first (zlib or none)
        void set_compressors(std::vector<uint32_t> tags) { m_compressors = std::move(tags); }
        void set_parent(const SHA1_Digest& parent_sha1) { m_parent_sha1 = parent_sha1; m_has_parent = true; }
        void set_logical_bytes(uint64_t bytes) { m_logical_bytes = bytes; }

        //Replaces the computed header SHA-1, for identity games in parent tests
        void set_sha1(const SHA1_Digest& sha1) { m_sha1_override = sha1; m_has_sha1_override = true; }

        uint32_t add_uncompressed(const std::vector<uint8_t>& data);
        uint32_t add_compressed(uint8_t slot, const std::vector<uint8_t>& stored, const std::vector<uint8_t>& decoded);
        uint32_t add_self(uint32_t target);
        uint32_t add_parent(uint64_t unit, const std::vector<uint8_t>& decoded);
        uint32_t add_mini(uint64_t literal);

        //v5 uncompressed map only: a hunk with no data (zeros, or the parent's same hunk)
        uint32_t add_unallocated(const std::vector<uint8_t>& decoded);

        void add_metadata(uint32_t tag, uint8_t flags, const std::vector<uint8_t>& data);
        void add_metadata(uint32_t tag, uint8_t flags, const std::string& text);

        std::vector<uint8_t> build();

        //Valid after build()
        size_t data_offset(uint32_t hunk) const { return m_hunks[hunk].file_offset; }
        SHA1_Digest sha1() const { return m_sha1; }
        SHA1_Digest raw_sha1() const { return m_raw_sha1; }
        std::vector<uint8_t> logical_data() const;

        static std::unique_ptr<Byte_Source> source(std::vector<uint8_t> bytes);
    private:
        struct Hunk
        {
            Hunk_Kind kind;
            uint8_t codec;
            std::vector<uint8_t> stored;
            uint64_t ref;
            bool unallocated;
            std::vector<uint8_t> decoded;
            size_t file_offset;
        };

        struct Metadata
        {
            uint32_t tag;
            uint8_t flags;
            std::vector<uint8_t> data;
        };

        uint32_t m_version;
        uint32_t m_hunk_bytes;
        uint32_t m_unit_bytes;
        uint64_t m_logical_bytes;
        std::vector<uint32_t> m_compressors;
        bool m_has_parent;
        SHA1_Digest m_parent_sha1;
        bool m_has_sha1_override;
        SHA1_Digest m_sha1_override;
        std::vector<Hunk> m_hunks;
        std::vector<Metadata> m_metadata;

        SHA1_Digest m_raw_sha1;
        SHA1_Digest m_sha1;

        uint32_t add(Hunk hunk);
        void compute_digests();
        void write_header(std::vector<uint8_t>& out, uint64_t map_offset, uint64_t meta_offset);
        void write_metadata(std::vector<uint8_t>& out);
        uint64_t write_v34_map(std::vector<uint8_t>& out);
        uint64_t write_v5_compressed_map(std::vector<uint8_t>& out);
        uint64_t write_v5_uncompressed_map(std::vector<uint8_t>& out);
};

#endif // TEST_IMAGE_HPP
