#ifndef HUNK_DECODER_HPP
#define HUNK_DECODER_HPP
#include <memory>
#include <mutex>
#include <vector>
#include "codec.hpp"

class Byte_Source;
class CHD_File;
class Hunk_Cache;
class Hunk_Map;
struct CHD_Header;
struct Hunk_Entry;

/*
Turns one map entry into hunk_bytes of data.
With cached set, hunks needed along the way (self copies, codec context, parent data)
come through the caches; otherwise everything is decoded from scratch and no cache is touched.
Each hunk depends on at most one other (its self-copy target, or the previous hunk for a
context codec). Hunks whose chain runs into a loop are found up front and fail with
Resolution_cycle_error before any cache is touched.
*/
class Hunk_Decoder
{
    public:
        Hunk_Decoder(const CHD_Header& header, const Hunk_Map& map, Byte_Source& source,
                     const Codec_Registry& codecs, Hunk_Cache& cache, CHD_File* parent, bool verify);

        void decode(uint32_t hunk, uint8_t* dest, bool cached);

        //Same as decode, but never checks the stored CRC and bypasses the caches. Used by whole-image verification.
        //previous, when set, holds hunk - 1 already decoded and saves re-running a context codec's chain.
        void decode_unchecked(uint32_t hunk, uint8_t* dest, const uint8_t* previous = nullptr);
    private:
        //Codecs keep internal buffers, so each decode borrows its own instance
        class Codec_Pool
        {
            public:
                Codec_Pool(const Codec_Registry& codecs, uint32_t tag, uint32_t hunk_bytes);

                std::unique_ptr<CHD_Codec> acquire();
                void release(std::unique_ptr<CHD_Codec> codec);
                bool needs_context() const { return m_needs_context; }
            private:
                const Codec_Registry& m_codecs;
                uint32_t m_tag;
                uint32_t m_hunk_bytes;
                bool m_needs_context;
                std::mutex m_lock;
                std::vector<std::unique_ptr<CHD_Codec>> m_idle;
        };

        const CHD_Header& m_header;
        const Hunk_Map& m_map;
        Byte_Source& m_source;
        Hunk_Cache& m_cache;
        CHD_File* m_parent;
        bool m_verify;
        std::vector<std::unique_ptr<Codec_Pool>> m_pools;

        std::vector<bool> m_cyclic;

        void find_cycles();
        bool depends_on(uint32_t hunk, uint32_t& target) const;

        void decode_entry(uint32_t hunk, uint8_t* dest, bool cached, bool check);
        void decode_compressed(uint32_t hunk, uint8_t* dest, bool cached, bool check);
        void run_codec(uint32_t hunk, uint8_t* dest, const uint8_t* context);
        void decode_self_copy(uint32_t hunk, uint8_t* dest, bool cached, bool check);
        void decode_parent_copy(uint32_t hunk, uint8_t* dest, bool cached);
        bool uses_context(uint32_t hunk) const;
};

#endif // HUNK_DECODER_HPP
