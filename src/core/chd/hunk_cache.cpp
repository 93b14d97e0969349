#include "hunk_cache.hpp"
#include "../logger.hpp"

Hunk_Cache::Hunk_Cache(uint32_t capacity, uint32_t hunk_bytes, bool threaded) :
    m_capacity(capacity), m_hunk_bytes(hunk_bytes), m_threaded(threaded)
{
}

Hunk_Buffer Hunk_Cache::decode_new(const Decode_Fn& decode)
{
    std::shared_ptr<std::vector<uint8_t>> buffer = std::make_shared<std::vector<uint8_t>>(m_hunk_bytes);
    decode(buffer->data());
    return buffer;
}

Hunk_Buffer Hunk_Cache::lookup(uint32_t hunk)
{
    auto it = m_entries.find(hunk);
    if (it == m_entries.end())
        return nullptr;
    m_lru.splice(m_lru.begin(), m_lru, it->second.recency);
    return it->second.buffer;
}

void Hunk_Cache::insert(uint32_t hunk, Hunk_Buffer buffer)
{
    auto it = m_entries.find(hunk);
    if (it != m_entries.end())
    {
        it->second.buffer = std::move(buffer);
        m_lru.splice(m_lru.begin(), m_lru, it->second.recency);
        return;
    }

    m_lru.push_front(hunk);
    m_entries[hunk] = Entry{std::move(buffer), m_lru.begin()};

    while (m_entries.size() > m_capacity)
    {
        uint32_t victim = m_lru.back();
        m_lru.pop_back();
        m_entries.erase(victim);
        dh_log->cache->trace("evicted hunk {}", victim);
    }
}

Hunk_Buffer Hunk_Cache::fetch(uint32_t hunk, const Decode_Fn& decode)
{
    if (m_capacity == 0)
        return decode_new(decode);

    if (!m_threaded)
    {
        Hunk_Buffer buffer = lookup(hunk);
        if (buffer)
            return buffer;
        buffer = decode_new(decode);
        insert(hunk, buffer);
        return buffer;
    }

    std::promise<Hunk_Buffer> result;
    std::shared_future<Hunk_Buffer> in_flight;
    {
        std::lock_guard<std::mutex> guard(m_lock);
        Hunk_Buffer buffer = lookup(hunk);
        if (buffer)
            return buffer;

        auto pending = m_pending.find(hunk);
        if (pending != m_pending.end())
            in_flight = pending->second;
        else
            m_pending[hunk] = result.get_future().share();
    }

    //Someone else is already decoding this hunk, wait for them
    if (in_flight.valid())
    {
        dh_log->cache->trace("waiting on in-flight decode of hunk {}", hunk);
        return in_flight.get();
    }

    Hunk_Buffer buffer;
    try
    {
        buffer = decode_new(decode);
    }
    catch (...)
    {
        {
            std::lock_guard<std::mutex> guard(m_lock);
            m_pending.erase(hunk);
        }
        result.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> guard(m_lock);
        insert(hunk, buffer);
        m_pending.erase(hunk);
    }
    result.set_value(buffer);
    return buffer;
}

bool Hunk_Cache::contains(uint32_t hunk)
{
    if (!m_threaded)
        return m_entries.count(hunk) != 0;
    std::lock_guard<std::mutex> guard(m_lock);
    return m_entries.count(hunk) != 0;
}

size_t Hunk_Cache::resident()
{
    if (!m_threaded)
        return m_entries.size();
    std::lock_guard<std::mutex> guard(m_lock);
    return m_entries.size();
}

void Hunk_Cache::clear()
{
    if (!m_threaded)
    {
        m_entries.clear();
        m_lru.clear();
        return;
    }
    std::lock_guard<std::mutex> guard(m_lock);
    m_entries.clear();
    m_lru.clear();
}
