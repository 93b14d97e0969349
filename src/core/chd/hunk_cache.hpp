#ifndef HUNK_CACHE_HPP
#define HUNK_CACHE_HPP
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

typedef std::shared_ptr<const std::vector<uint8_t>> Hunk_Buffer;

/*
LRU cache of decoded hunks.
At most one decode per hunk is in flight: late arrivals wait on the first caller's
future and get its buffer (or its exception). Failed decodes are never cached.
*/
class Hunk_Cache
{
    public:
        //Fills hunk_bytes bytes at dest or throws
        typedef std::function<void(uint8_t* dest)> Decode_Fn;

        Hunk_Cache(uint32_t capacity, uint32_t hunk_bytes, bool threaded);

        Hunk_Buffer fetch(uint32_t hunk, const Decode_Fn& decode);

        bool contains(uint32_t hunk);

        uint32_t capacity() const { return m_capacity; }
        size_t resident();
        void clear();
    private:
        struct Entry
        {
            Hunk_Buffer buffer;
            std::list<uint32_t>::iterator recency;
        };

        uint32_t m_capacity;
        uint32_t m_hunk_bytes;
        bool m_threaded;

        std::mutex m_lock;
        std::list<uint32_t> m_lru;//front is most recently used
        std::unordered_map<uint32_t, Entry> m_entries;
        std::unordered_map<uint32_t, std::shared_future<Hunk_Buffer>> m_pending;

        Hunk_Buffer decode_new(const Decode_Fn& decode);
        Hunk_Buffer lookup(uint32_t hunk);
        void insert(uint32_t hunk, Hunk_Buffer buffer);
};

#endif // HUNK_CACHE_HPP
