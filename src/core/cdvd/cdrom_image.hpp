#ifndef CDROM_IMAGE_HPP
#define CDROM_IMAGE_HPP
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "msf_index.hpp"
#include "../chd/checksum.hpp"

class CHD_File;
class CHD_Metadata;

#define CD_SECTOR_SIZE 2352
#define CD_SUBCODE_SIZE 96
#define CD_FRAME_BYTES (CD_SECTOR_SIZE + CD_SUBCODE_SIZE)
#define CD_USER_DATA_SIZE 2048

//Frames before track 1 (the 2 second lead-in pregap), never stored in the image
#define CD_FIRST_TRACK_LBA 150

//CHD pads each track to a multiple of this many frames
#define CD_TRACK_PADDING 4

enum class CD_Track_Type
{
    Mode1,
    Mode1_Raw,
    Mode2,
    Mode2_Form1,
    Mode2_Form2,
    Mode2_Form_Mix,
    Mode2_Raw,
    Audio
};

struct CD_Track
{
    uint32_t number;
    CD_Track_Type type;
    std::string type_name;
    std::string subtype;
    uint32_t frames;

    //CHT2 only
    uint32_t pregap;
    std::string pregap_type;
    std::string pregap_subtype;
    uint32_t postgap;

    uint32_t start_lba;//first frame as seen by the drive
    uint32_t chd_frame;//first frame in the image, including padding of earlier tracks

    //Bytes of the sector the track actually stores, and where the 2048 byte user area sits
    uint32_t data_size() const;
    uint32_t user_data_offset() const;
};

//Parses one CHTR (v2 false) or CHT2 (v2 true) record. Throws Format_error.
CD_Track parse_cd_track(const std::string& text, bool v2);

//Every track record in the image, in track order, with LBAs filled in
std::vector<CD_Track> parse_cd_tracks(const CHD_Metadata& metadata);

enum class CD_Event
{
    None,
    Track_Change,
    End_Of_Disc
};

/*
Tracks are laid out back to back from LBA 150; a track's pregap frames count as part of it.
Besides random access by LBA, there is one play/read position that a drive steps through.
The position is not thread-safe.
*/
class CDROM_Image
{
    public:
        CDROM_Image(CHD_File& file);

        const std::vector<CD_Track>& tracks() const { return m_tracks; }

        //One past the last readable LBA
        uint32_t end_lba() const;

        const CD_Track& track_for_lba(uint32_t lba) const;

        //INDEX 01 of a track (1-based). Track 0 gives the length of the whole disc.
        MSF_Index track_start(uint8_t track) const;

        //2352 bytes. LBAs in the lead-in pregap read as zeros; audio comes out little-endian.
        void read_sector(uint32_t lba, uint8_t* dest);
        void read_subcode(uint32_t lba, uint8_t* dest);

        //The 2048 byte user data area of a data sector
        void read_user_data(uint32_t lba, uint8_t* dest);

        std::vector<SHA1_Digest> track_sha1s();

        //Below LBA 150 the position belongs to track 1. Throws Out_of_range_error past the last track.
        void set_location_lba(uint32_t lba);
        void set_location(const MSF_Index& msf);
        void set_location_to_track(uint8_t track);

        //Steps one sector. At the end of the disc the position stays put.
        CD_Event advance_position();

        uint32_t current_lba() const { return m_current_lba; }
        uint8_t current_track() const { return (uint8_t)(m_current_track + 1); }
        CD_Track_Type current_track_type() const { return m_tracks[m_current_track].type; }

        //0 inside the pregap, 1 from INDEX 01 on
        uint8_t current_index() const;

        //Relative to INDEX 01. Pregap positions count down from 100:00:00.
        MSF_Index current_track_local_msf() const;
        MSF_Index current_global_msf() const;

        void read_current_sector(uint8_t* dest);
        void read_current_subcode(uint8_t* dest);

        //Sectors whose subchannel Q was replaced on the original disc, usually from an SBI file
        void set_invalid_subq_lbas(std::set<uint32_t> lbas);
        bool subchannel_q_valid() const;
    private:
        CHD_File& m_file;
        std::vector<CD_Track> m_tracks;
        std::set<uint32_t> m_invalid_subq;

        uint32_t m_current_lba;
        size_t m_current_track;

        size_t track_index_for_lba(uint32_t lba) const;
        uint64_t frame_offset(uint32_t lba, const CD_Track& track) const;
};

#endif // CDROM_IMAGE_HPP
