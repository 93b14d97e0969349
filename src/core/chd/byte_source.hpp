#ifndef BYTE_SOURCE_HPP
#define BYTE_SOURCE_HPP
#include <cstdint>
#include <string>
#include <vector>

//Random access reads only. Implementations must be safe to call from several threads at once.
class Byte_Source
{
    public:
        virtual ~Byte_Source() {}

        //Fills dest completely or throws (Truncated_error past the end, Source_io_error otherwise)
        virtual void read_at(uint64_t offset, uint8_t* dest, size_t length) = 0;
        virtual uint64_t size() = 0;

        std::vector<uint8_t> read_at(uint64_t offset, size_t length);
};

class File_Source : public Byte_Source
{
    public:
        File_Source(const std::string& path);
        ~File_Source();

        void read_at(uint64_t offset, uint8_t* dest, size_t length) override;
        uint64_t size() override;
        using Byte_Source::read_at;

        const std::string& path() const { return m_path; }
    private:
        std::string m_path;
        int m_fd;
        uint64_t m_size;
};

class Memory_Source : public Byte_Source
{
    public:
        Memory_Source(std::vector<uint8_t> data);

        void read_at(uint64_t offset, uint8_t* dest, size_t length) override;
        uint64_t size() override;
        using Byte_Source::read_at;
    private:
        std::vector<uint8_t> m_data;
};

#endif // BYTE_SOURCE_HPP
