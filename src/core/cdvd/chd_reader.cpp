#include "chd_reader.hpp"
#include "sbi.hpp"
#include "../chd/chd_file.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <cstring>
#include <sys/stat.h>

CHD_Reader::CHD_Reader(CHD_Options options) : m_options(options)
{

}

CHD_Reader::~CHD_Reader()
{

}

bool CHD_Reader::open(std::string name)
{
    close();

    size_t slash = name.find_last_of('/');
    m_locator = Path_Parent_Locator();
    m_locator.add_directory(slash == std::string::npos ? "." : name.substr(0, slash));

    try
    {
        m_file = CHD_File::open(name, m_options, &m_locator);
        m_image = std::unique_ptr<CDROM_Image>(new CDROM_Image(*m_file));
    }
    catch (CHD_Error& e)
    {
        dh_log->cdrom->error("chd: open {}: {}", name, e.what());
        close();
        return false;
    }

    load_sbi(name);
    m_first_lba = m_image->tracks().front().start_lba;
    m_sector_count = m_image->end_lba() - m_first_lba;
    return true;
}

std::string CHD_Reader::sbi_path(const std::string& name)
{
    size_t slash = name.find_last_of('/');
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return name + ".sbi";
    return name.substr(0, dot) + ".sbi";
}

void CHD_Reader::load_sbi(const std::string& name)
{
    std::string path = sbi_path(name);
    struct stat info;
    if (stat(path.c_str(), &info) != 0)
        return;

    try
    {
        m_image->set_invalid_subq_lbas(load_sbi_file(path));
        dh_log->cdrom->info("chd: loaded {}", path);
    }
    catch (CHD_Error& e)
    {
        Errors::print_warning("chd: ignoring %s: %s", path.c_str(), e.what());
    }
}

void CHD_Reader::close()
{
    m_image.reset();
    m_file.reset();
    m_first_lba = 0;
    m_sector_count = 0;
    m_sector = 0;
    m_sector_pos = 0;
}

size_t CHD_Reader::read(uint8_t* buff, size_t bytes)
{
    if (!m_image)
        return 0;

    uint8_t sector[CD_USER_DATA_SIZE];
    size_t total_read = 0;
    while (total_read < bytes && m_sector < m_sector_count)
    {
        try
        {
            m_image->read_user_data(m_first_lba + m_sector, sector);
        }
        catch (CHD_Error& e)
        {
            dh_log->cdrom->error("chd: read of sector {}: {}", m_first_lba + m_sector, e.what());
            return total_read;
        }

        size_t count = std::min<size_t>(CD_USER_DATA_SIZE - m_sector_pos, bytes - total_read);
        memcpy(buff + total_read, sector + m_sector_pos, count);
        total_read += count;
        m_sector_pos += count;
        if (m_sector_pos == CD_USER_DATA_SIZE)
        {
            m_sector++;
            m_sector_pos = 0;
        }
    }
    return total_read;
}

void CHD_Reader::seek(size_t ofs, std::ios::seekdir whence)
{
    if (whence == std::ios::beg)
    {
        if (ofs < m_sector_count)
            m_sector = (uint32_t)ofs;
    }
    else if (whence == std::ios::cur)
    {
        if (m_sector + ofs < m_sector_count)
            m_sector = (uint32_t)(m_sector + ofs);
    }
    else if (whence == std::ios::end)
    {
        if (ofs > 0 && ofs <= m_sector_count)
            m_sector = (uint32_t)(m_sector_count - ofs);
    }
    m_sector_pos = 0;
}

bool CHD_Reader::is_open()
{
    return m_image != nullptr;
}

size_t CHD_Reader::get_size()
{
    return (size_t)m_sector_count * CD_USER_DATA_SIZE;
}
