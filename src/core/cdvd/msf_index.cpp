#include "msf_index.hpp"
#include "../errors.hpp"

#include <cctype>
#include <cstdio>

#define btoi(b) ((b)/16*10 + (b)%16)    /* BCD to u_char */
#define itob(i) ((i)/10*16 + (i)%10)    /* u_char to BCD */

MSF_Index::MSF_Index() : minutes(0), seconds(0), frames(0)
{

}

MSF_Index::MSF_Index(uint32_t minutes, uint32_t seconds, uint32_t frames)
{
    if (minutes > 99 || seconds > 59 || frames >= CD_FRAMES_PER_SECOND)
        Errors::raise<Out_of_range_error>("%u:%u:%u is not a valid disc address", minutes, seconds, frames);
    this->minutes = (uint8_t)minutes;
    this->seconds = (uint8_t)seconds;
    this->frames = (uint8_t)frames;
}

MSF_Index MSF_Index::from_lba(uint32_t lba)
{
    if (lba >= CD_MSF_LIMIT)
        Errors::raise<Out_of_range_error>("LBA %u is past 99:59:74", lba);

    uint32_t m = lba / CD_FRAMES_PER_MINUTE;
    lba -= m * CD_FRAMES_PER_MINUTE;
    uint32_t s = lba / CD_FRAMES_PER_SECOND;
    uint32_t f = lba - s * CD_FRAMES_PER_SECOND;
    return MSF_Index(m, s, f);
}

MSF_Index MSF_Index::from_bcd(uint8_t m, uint8_t s, uint8_t f)
{
    const uint8_t bcd[] = {m, s, f};
    for (uint8_t value : bcd)
    {
        if ((value >> 4) > 9 || (value & 0xF) > 9)
            Errors::raise<Format_error>("$%02X:$%02X:$%02X is not BCD", m, s, f);
    }
    return MSF_Index(btoi(m), btoi(s), btoi(f));
}

MSF_Index MSF_Index::parse(const std::string& text)
{
    unsigned int m, s, f;
    int consumed = 0;
    if (std::sscanf(text.c_str(), " %u:%u:%u %n", &m, &s, &f, &consumed) != 3 || consumed != (int)text.size())
        Errors::raise<Format_error>("can't parse \"%s\" as mm:ss:ff", text.c_str());
    return MSF_Index(m, s, f);
}

uint32_t MSF_Index::to_lba() const
{
    return minutes * CD_FRAMES_PER_MINUTE + seconds * CD_FRAMES_PER_SECOND + frames;
}

void MSF_Index::to_bcd(uint8_t* out) const
{
    out[0] = itob(minutes);
    out[1] = itob(seconds);
    out[2] = itob(frames);
}

std::string MSF_Index::to_string() const
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02u:%02u:%02u", (unsigned)minutes, (unsigned)seconds, (unsigned)frames);
    return buffer;
}

MSF_Index MSF_Index::next() const
{
    return *this + MSF_Index(0, 0, 1);
}

MSF_Index MSF_Index::operator+(const MSF_Index& other) const
{
    uint32_t sum = to_lba() + other.to_lba();
    if (sum >= CD_MSF_LIMIT)
        Errors::raise<Out_of_range_error>("%s + %s overflows", to_string().c_str(), other.to_string().c_str());
    return from_lba(sum);
}

MSF_Index MSF_Index::operator-(const MSF_Index& other) const
{
    if (other > *this)
        Errors::raise<Out_of_range_error>("%s - %s underflows", to_string().c_str(), other.to_string().c_str());
    return from_lba(to_lba() - other.to_lba());
}
