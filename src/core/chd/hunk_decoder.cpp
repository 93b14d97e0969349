#include "hunk_decoder.hpp"
#include "byte_source.hpp"
#include "chd_file.hpp"
#include "chd_header.hpp"
#include "chd_verifier.hpp"
#include "hunk_cache.hpp"
#include "hunk_map.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <cstring>

Hunk_Decoder::Codec_Pool::Codec_Pool(const Codec_Registry& codecs, uint32_t tag, uint32_t hunk_bytes) :
    m_codecs(codecs), m_tag(tag), m_hunk_bytes(hunk_bytes)
{
    std::unique_ptr<CHD_Codec> first = m_codecs.create(m_tag, m_hunk_bytes);
    m_needs_context = first->needs_context();
    m_idle.push_back(std::move(first));
}

std::unique_ptr<CHD_Codec> Hunk_Decoder::Codec_Pool::acquire()
{
    {
        std::lock_guard<std::mutex> guard(m_lock);
        if (!m_idle.empty())
        {
            std::unique_ptr<CHD_Codec> codec = std::move(m_idle.back());
            m_idle.pop_back();
            return codec;
        }
    }
    return m_codecs.create(m_tag, m_hunk_bytes);
}

void Hunk_Decoder::Codec_Pool::release(std::unique_ptr<CHD_Codec> codec)
{
    std::lock_guard<std::mutex> guard(m_lock);
    m_idle.push_back(std::move(codec));
}

Hunk_Decoder::Hunk_Decoder(const CHD_Header& header, const Hunk_Map& map, Byte_Source& source,
                           const Codec_Registry& codecs, Hunk_Cache& cache, CHD_File* parent, bool verify) :
    m_header(header), m_map(map), m_source(source), m_cache(cache), m_parent(parent), m_verify(verify)
{
    for (uint32_t i = 0; i < header.compressor_count; i++)
    {
        if (header.compressors[i] == CHD_CODEC_NONE)
            m_pools.push_back(nullptr);
        else
            m_pools.push_back(std::unique_ptr<Codec_Pool>(new Codec_Pool(codecs, header.compressors[i], header.hunk_bytes)));
    }
    find_cycles();
}

bool Hunk_Decoder::depends_on(uint32_t hunk, uint32_t& target) const
{
    const Hunk_Entry& entry = m_map[hunk];
    if (entry.kind == Hunk_Kind::Self_Copy)
    {
        target = (uint32_t)entry.offset;
        return true;
    }
    if (hunk > 0 && uses_context(hunk))
    {
        target = hunk - 1;
        return true;
    }
    return false;
}

//Every hunk has at most one dependency, so each walk either ends or runs into a loop
void Hunk_Decoder::find_cycles()
{
    enum : uint8_t { UNSEEN, WALKING, RESOLVES, LOOPS };
    uint32_t count = m_map.size();
    std::vector<uint8_t> state(count, UNSEEN);
    m_cyclic.assign(count, false);

    std::vector<uint32_t> path;
    for (uint32_t start = 0; start < count; start++)
    {
        if (state[start] != UNSEEN)
            continue;

        path.clear();
        uint32_t hunk = start;
        bool has_next = true;
        while (state[hunk] == UNSEEN)
        {
            state[hunk] = WALKING;
            path.push_back(hunk);
            uint32_t target;
            has_next = depends_on(hunk, target);
            if (!has_next)
                break;
            hunk = target;
        }

        bool loops = has_next && (state[hunk] == WALKING || state[hunk] == LOOPS);
        for (uint32_t h : path)
        {
            state[h] = loops ? LOOPS : RESOLVES;
            m_cyclic[h] = loops;
        }
        if (loops)
            dh_log->chd->warn("hunk {} depends on a loop through hunk {}", start, hunk);
    }
}

void Hunk_Decoder::decode(uint32_t hunk, uint8_t* dest, bool cached)
{
    if (m_cyclic[hunk])
        Errors::raise<Resolution_cycle_error>("hunk %u depends on itself through a chain of other hunks", hunk);
    decode_entry(hunk, dest, cached, m_verify);
}

void Hunk_Decoder::decode_unchecked(uint32_t hunk, uint8_t* dest, const uint8_t* previous)
{
    if (m_cyclic[hunk])
        Errors::raise<Resolution_cycle_error>("hunk %u depends on itself through a chain of other hunks", hunk);
    if (previous && hunk > 0 && uses_context(hunk))
    {
        run_codec(hunk, dest, previous);
        return;
    }
    decode_entry(hunk, dest, false, false);
}

void Hunk_Decoder::decode_entry(uint32_t hunk, uint8_t* dest, bool cached, bool check)
{
    const Hunk_Entry& entry = m_map[hunk];
    switch (entry.kind)
    {
        case Hunk_Kind::Uncompressed:
            if (entry.length != m_header.hunk_bytes)
            {
                Errors::raise<Size_mismatch_error>("uncompressed hunk %u is %u bytes, hunks are %u",
                                                   hunk, entry.length, m_header.hunk_bytes);
            }
            m_source.read_at(entry.offset, dest, m_header.hunk_bytes);
            break;
        case Hunk_Kind::Compressed:
            decode_compressed(hunk, dest, cached, check);
            break;
        case Hunk_Kind::Mini:
            Hunk_Map::expand_mini(entry.offset, dest, m_header.hunk_bytes);
            break;
        case Hunk_Kind::Self_Copy:
            //the hunk that actually holds the data checks itself
            decode_self_copy(hunk, dest, cached, check);
            return;
        case Hunk_Kind::Parent_Copy:
            decode_parent_copy(hunk, dest, cached);
            return;
    }

    if (check)
        CHD_Verifier::verify_hunk(hunk, dest, m_header.hunk_bytes, entry);
}

bool Hunk_Decoder::uses_context(uint32_t hunk) const
{
    const Hunk_Entry& entry = m_map[hunk];
    return entry.kind == Hunk_Kind::Compressed && m_pools[entry.codec]->needs_context();
}

void Hunk_Decoder::run_codec(uint32_t hunk, uint8_t* dest, const uint8_t* context)
{
    const Hunk_Entry& entry = m_map[hunk];
    std::vector<uint8_t> compressed = m_source.read_at(entry.offset, entry.length);

    Codec_Pool& pool = *m_pools[entry.codec];
    std::unique_ptr<CHD_Codec> codec = pool.acquire();
    try
    {
        codec->decompress(compressed.data(), entry.length, dest, m_header.hunk_bytes, context);
    }
    catch (Codec_error& e)
    {
        //the instance may be left in a bad state, so it isn't returned to the pool
        dh_log->codec->error("hunk {} ({}): {}", hunk, tag_to_string(m_header.compressors[entry.codec]), e.what());
        Errors::raise<Codec_error>("hunk %u: %s", hunk, e.what());
    }
    pool.release(std::move(codec));
}

void Hunk_Decoder::decode_compressed(uint32_t hunk, uint8_t* dest, bool cached, bool check)
{
    if (!uses_context(hunk))
    {
        run_codec(hunk, dest, nullptr);
        return;
    }

    //Walk back to the start of the run we have to decode, stopping early at anything cached
    uint32_t first = hunk;
    while (first > 0 && uses_context(first - 1))
    {
        if (cached && m_cache.contains(first - 1))
            break;
        first--;
    }

    uint32_t hunk_bytes = m_header.hunk_bytes;
    std::vector<uint8_t> context;
    if (first > 0)
    {
        context.resize(hunk_bytes);
        uint32_t prev = first - 1;
        if (cached)
        {
            Hunk_Buffer buffer = m_cache.fetch(prev, [this, prev](uint8_t* d) { decode(prev, d, true); });
            memcpy(context.data(), buffer->data(), hunk_bytes);
        }
        else
            decode_entry(prev, context.data(), false, false);
    }

    std::vector<uint8_t> next(hunk_bytes);
    for (uint32_t k = first; k < hunk; k++)
    {
        run_codec(k, next.data(), k > 0 ? context.data() : nullptr);
        if (check)
            CHD_Verifier::verify_hunk(k, next.data(), hunk_bytes, m_map[k]);
        if (cached)
            m_cache.fetch(k, [&next, hunk_bytes](uint8_t* d) { memcpy(d, next.data(), hunk_bytes); });
        context.swap(next);
        next.resize(hunk_bytes);
    }

    run_codec(hunk, dest, hunk > 0 ? context.data() : nullptr);
}

void Hunk_Decoder::decode_self_copy(uint32_t hunk, uint8_t* dest, bool cached, bool check)
{
    //find_cycles guarantees this chain ends
    uint32_t target = hunk;
    while (m_map[target].kind == Hunk_Kind::Self_Copy)
        target = (uint32_t)m_map[target].offset;

    dh_log->chd->trace("hunk {} is a copy of hunk {}", hunk, target);
    if (cached)
    {
        Hunk_Buffer buffer = m_cache.fetch(target, [this, target](uint8_t* d) { decode(target, d, true); });
        memcpy(dest, buffer->data(), m_header.hunk_bytes);
    }
    else
        decode_entry(target, dest, false, check);
}

void Hunk_Decoder::decode_parent_copy(uint32_t hunk, uint8_t* dest, bool cached)
{
    if (!m_parent)
        Errors::raise<Index_corrupt_error>("hunk %u references a parent, but none is open", hunk);

    const Hunk_Entry& entry = m_map[hunk];
    m_parent->copy_span(entry.offset * m_header.unit_bytes, dest, m_header.hunk_bytes, cached);
}
