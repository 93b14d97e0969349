#include "byte_source.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

std::vector<uint8_t> Byte_Source::read_at(uint64_t offset, size_t length)
{
    std::vector<uint8_t> data(length);
    if (length)
        read_at(offset, data.data(), length);
    return data;
}

File_Source::File_Source(const std::string& path) : m_path(path), m_fd(-1), m_size(0)
{
    m_fd = ::open(path.c_str(), O_RDONLY);
    if (m_fd < 0)
        Errors::raise<Source_io_error>("failed to open %s: %s", path.c_str(), strerror(errno));

    struct stat st;
    if (fstat(m_fd, &st) != 0)
    {
        int err = errno;
        ::close(m_fd);
        m_fd = -1;
        Errors::raise<Source_io_error>("failed to stat %s: %s", path.c_str(), strerror(err));
    }
    m_size = (uint64_t)st.st_size;
    dh_log->main->debug("opened {} ({} bytes)", path, m_size);
}

File_Source::~File_Source()
{
    if (m_fd >= 0)
        ::close(m_fd);
}

void File_Source::read_at(uint64_t offset, uint8_t* dest, size_t length)
{
    if (offset > m_size || length > m_size - offset)
    {
        Errors::raise<Truncated_error>("read of %zu bytes at $%llX runs past the end of %s",
                                       length, (unsigned long long)offset, m_path.c_str());
    }

    // pread keeps no cursor, so concurrent readers can't step on each other
    size_t done = 0;
    while (done < length)
    {
        ssize_t got = pread(m_fd, dest + done, length - done, (off_t)(offset + done));
        if (got < 0)
        {
            if (errno == EINTR)
                continue;
            Errors::raise<Source_io_error>("read error at $%llX in %s: %s",
                                           (unsigned long long)(offset + done), m_path.c_str(), strerror(errno));
        }
        if (got == 0)
        {
            Errors::raise<Truncated_error>("unexpected end of %s at $%llX",
                                           m_path.c_str(), (unsigned long long)(offset + done));
        }
        done += (size_t)got;
    }
}

uint64_t File_Source::size()
{
    return m_size;
}

Memory_Source::Memory_Source(std::vector<uint8_t> data) : m_data(std::move(data))
{

}

void Memory_Source::read_at(uint64_t offset, uint8_t* dest, size_t length)
{
    if (offset > m_data.size() || length > m_data.size() - offset)
    {
        Errors::raise<Truncated_error>("read of %zu bytes at $%llX runs past the end of a %zu byte buffer",
                                       length, (unsigned long long)offset, m_data.size());
    }
    if (length)
        memcpy(dest, m_data.data() + offset, length);
}

uint64_t Memory_Source::size()
{
    return m_data.size();
}
