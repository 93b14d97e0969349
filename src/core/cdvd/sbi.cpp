#include "sbi.hpp"
#include "msf_index.hpp"
#include "../chd/byte_source.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <cstring>

std::set<uint32_t> parse_sbi(const std::vector<uint8_t>& data)
{
    if (data.size() < SBI_MAGIC_SIZE || memcmp(data.data(), SBI_MAGIC, SBI_MAGIC_SIZE) != 0)
        Errors::raise<Format_error>("not an SBI file (bad magic)");

    std::set<uint32_t> lbas;
    size_t index = SBI_MAGIC_SIZE;
    while (index + 3 < data.size())
    {
        MSF_Index msf = MSF_Index::from_bcd(data[index], data[index + 1], data[index + 2]);
        lbas.insert(msf.to_lba());

        uint8_t mode = data[index + 3];
        if (mode == 1)
            index += 4 + 10;//the whole Q channel minus its CRC
        else if (mode <= 3)
            index += 4 + 3;
        else
            Errors::raise<Format_error>("SBI record for %s has unknown format %u", msf.to_string().c_str(), mode);
    }
    return lbas;
}

std::set<uint32_t> load_sbi_file(const std::string& path)
{
    File_Source file(path);
    std::vector<uint8_t> data = file.read_at(0, (size_t)file.size());
    std::set<uint32_t> lbas = parse_sbi(data);
    dh_log->cdrom->debug("{}: {} sectors with replaced subchannel Q", path, lbas.size());
    return lbas;
}
