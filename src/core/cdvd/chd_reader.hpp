#ifndef CHD_READER_HPP
#define CHD_READER_HPP

#include <memory>
#include "cdvd_container.hpp"
#include "cdrom_image.hpp"
#include "../chd/chd_options.hpp"
#include "../chd/parent_locator.hpp"

class CHD_File;

class CHD_Reader : public CDVD_Container
{
    public:
        CHD_Reader(CHD_Options options = CHD_Options());
        ~CHD_Reader();

        //Parents are looked for next to the image, as is an SBI file with the same name
        bool open(std::string name) override;
        void close() override;
        size_t read(uint8_t* buff, size_t bytes) override;
        void seek(size_t pos, std::ios::seekdir whence) override;

        bool is_open() override;
        size_t get_size() override;

        Path_Parent_Locator& parent_locator() { return m_locator; }
        CDROM_Image* image() { return m_image.get(); }

        static std::string sbi_path(const std::string& name);
    private:
        CHD_Options m_options;
        Path_Parent_Locator m_locator;
        std::unique_ptr<CHD_File> m_file;
        std::unique_ptr<CDROM_Image> m_image;

        uint32_t m_first_lba {0};
        uint32_t m_sector_count {0};
        uint32_t m_sector {0};//relative to m_first_lba
        uint32_t m_sector_pos {0};//bytes already consumed from m_sector

        void load_sbi(const std::string& name);
};

#endif // CHD_READER_HPP
