#ifndef MSF_INDEX_HPP
#define MSF_INDEX_HPP
#include <cstdint>
#include <string>

#define CD_FRAMES_PER_SECOND 75
#define CD_FRAMES_PER_MINUTE (60 * CD_FRAMES_PER_SECOND)

//Minutes stop at 99, so this is one past the last addressable LBA
#define CD_MSF_LIMIT (100 * CD_FRAMES_PER_MINUTE)

/*
A disc address in minutes, seconds and frames (75 to the second).
Values are plain binary; the drive's BCD form only appears through from_bcd/to_bcd.
LBA 0 is 00:00:00, so track 1 normally starts at 00:02:00.
*/
struct MSF_Index
{
    uint8_t minutes;
    uint8_t seconds;
    uint8_t frames;

    MSF_Index();

    //Throws Out_of_range_error past 99:59:74
    MSF_Index(uint32_t minutes, uint32_t seconds, uint32_t frames);

    static MSF_Index from_lba(uint32_t lba);

    //Throws Format_error when a nibble isn't a decimal digit
    static MSF_Index from_bcd(uint8_t m, uint8_t s, uint8_t f);

    //"mm:ss:ff", surrounding whitespace allowed
    static MSF_Index parse(const std::string& text);

    uint32_t to_lba() const;
    void to_bcd(uint8_t* out) const;//3 bytes
    std::string to_string() const;

    //Arithmetic that leaves 00:00:00 - 99:59:74 throws Out_of_range_error
    MSF_Index next() const;
    MSF_Index operator+(const MSF_Index& other) const;
    MSF_Index operator-(const MSF_Index& other) const;

    bool operator==(const MSF_Index& other) const { return to_lba() == other.to_lba(); }
    bool operator!=(const MSF_Index& other) const { return to_lba() != other.to_lba(); }
    bool operator<(const MSF_Index& other) const { return to_lba() < other.to_lba(); }
    bool operator<=(const MSF_Index& other) const { return to_lba() <= other.to_lba(); }
    bool operator>(const MSF_Index& other) const { return to_lba() > other.to_lba(); }
    bool operator>=(const MSF_Index& other) const { return to_lba() >= other.to_lba(); }
};

#endif // MSF_INDEX_HPP
