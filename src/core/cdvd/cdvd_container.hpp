#ifndef CDVD_CONTAINER_HPP
#define CDVD_CONTAINER_HPP
#include <cstdint>
#include <fstream>
#include <string>

//What a disc drive needs from an image: the 2048 byte user area of each sector, in order
class CDVD_Container
{
    public:
        virtual ~CDVD_Container() {}

        virtual bool open(std::string name) = 0;
        virtual void close() = 0;
        virtual size_t read(uint8_t* buff, size_t bytes) = 0;

        //pos counts sectors
        virtual void seek(size_t pos, std::ios::seekdir whence) = 0;

        virtual bool is_open() = 0;
        virtual size_t get_size() = 0;
};

#endif // CDVD_CONTAINER_HPP
