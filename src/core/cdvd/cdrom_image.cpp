#include "cdrom_image.hpp"
#include "../chd/chd_file.hpp"
#include "../chd/chd_metadata.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <utility>

uint32_t CD_Track::data_size() const
{
    switch (type)
    {
        case CD_Track_Type::Mode1:
        case CD_Track_Type::Mode2_Form1:
            return 2048;
        case CD_Track_Type::Mode2:
        case CD_Track_Type::Mode2_Form_Mix:
            return 2336;
        case CD_Track_Type::Mode2_Form2:
            return 2324;
        case CD_Track_Type::Mode1_Raw:
        case CD_Track_Type::Mode2_Raw:
        case CD_Track_Type::Audio:
            return CD_SECTOR_SIZE;
    }
    return CD_SECTOR_SIZE;
}

uint32_t CD_Track::user_data_offset() const
{
    switch (type)
    {
        case CD_Track_Type::Mode1_Raw:
            return 16;
        case CD_Track_Type::Mode2_Raw:
            return 24;
        case CD_Track_Type::Mode2:
        case CD_Track_Type::Mode2_Form_Mix:
            return 8;
        default:
            return 0;
    }
}

static CD_Track_Type track_type_from_string(const std::string& name)
{
    if (name == "MODE1")
        return CD_Track_Type::Mode1;
    if (name == "MODE1_RAW")
        return CD_Track_Type::Mode1_Raw;
    if (name == "MODE2")
        return CD_Track_Type::Mode2;
    if (name == "MODE2_FORM1")
        return CD_Track_Type::Mode2_Form1;
    if (name == "MODE2_FORM2")
        return CD_Track_Type::Mode2_Form2;
    if (name == "MODE2_FORM_MIX")
        return CD_Track_Type::Mode2_Form_Mix;
    if (name == "MODE2_RAW")
        return CD_Track_Type::Mode2_Raw;
    if (name == "AUDIO")
        return CD_Track_Type::Audio;
    Errors::raise<Format_error>("unknown track type %s", name.c_str());
}

CD_Track parse_cd_track(const std::string& text, bool v2)
{
    // the string buffers below can hold anything that fits in the whole record
    if (text.size() > 255)
        Errors::raise<Format_error>("track metadata is too long (%zu bytes)", text.size());

    char type_str[256] = {0};
    char subtype_str[256] = {0};
    char pgtype_str[256] = {0};
    char pgsub_str[256] = {0};
    int track_num = 0, frames = 0, pregap_frames = 0, postgap_frames = 0;

    int matched;
    if (v2)
    {
        matched = std::sscanf(text.c_str(), CDROM_TRACK_METADATA2_FORMAT, &track_num, type_str, subtype_str, &frames,
                              &pregap_frames, pgtype_str, pgsub_str, &postgap_frames);
    }
    else
        matched = std::sscanf(text.c_str(), CDROM_TRACK_METADATA_FORMAT, &track_num, type_str, subtype_str, &frames);

    if (matched != (v2 ? 8 : 4))
        Errors::raise<Format_error>("can't parse track metadata \"%s\"", text.c_str());
    if (track_num <= 0 || frames < 0 || pregap_frames < 0 || postgap_frames < 0)
        Errors::raise<Format_error>("track metadata \"%s\" has negative fields", text.c_str());

    CD_Track track;
    track.number = track_num;
    track.type_name = type_str;
    track.type = track_type_from_string(track.type_name);
    track.subtype = subtype_str;
    track.frames = frames;
    track.pregap = pregap_frames;
    track.pregap_type = pgtype_str;
    track.pregap_subtype = pgsub_str;
    track.postgap = postgap_frames;
    track.start_lba = 0;
    track.chd_frame = 0;
    return track;
}

std::vector<CD_Track> parse_cd_tracks(const CHD_Metadata& metadata)
{
    std::vector<CD_Track> tracks;
    uint32_t lba = CD_FIRST_TRACK_LBA;
    uint32_t chd_frame = 0;

    for (uint32_t index = 0; ; index++)
    {
        CD_Track track;
        if (metadata.has(CDROM_TRACK_METADATA2_TAG, index))
            track = parse_cd_track(metadata.find(CDROM_TRACK_METADATA2_TAG, index).text(), true);
        else if (metadata.has(CDROM_TRACK_METADATA_TAG, index))
            track = parse_cd_track(metadata.find(CDROM_TRACK_METADATA_TAG, index).text(), false);
        else
            break;

        if (track.number != index + 1)
            Errors::raise<Format_error>("track %u found where track %u should be", track.number, index + 1);

        track.start_lba = lba;
        track.chd_frame = chd_frame;
        lba += track.frames;
        chd_frame += track.frames + (CD_TRACK_PADDING - track.frames % CD_TRACK_PADDING) % CD_TRACK_PADDING;

        dh_log->cdrom->debug("track {}: {} ({}), {} frames from LBA {}, image frame {}",
                             track.number, track.type_name, track.subtype, track.frames,
                             track.start_lba, track.chd_frame);
        tracks.push_back(track);
    }
    return tracks;
}

CDROM_Image::CDROM_Image(CHD_File& file) : m_file(file), m_current_lba(CD_FIRST_TRACK_LBA), m_current_track(0)
{
    if (file.hunk_bytes() % CD_FRAME_BYTES != 0)
        Errors::raise<Format_error>("hunks of %u bytes don't hold whole CD frames", file.hunk_bytes());

    m_tracks = parse_cd_tracks(file.metadata());
    if (m_tracks.empty())
        Errors::raise<Format_error>("image has no CD track metadata");

    const CD_Track& last = m_tracks.back();
    uint64_t needed = (uint64_t)(last.chd_frame + last.frames) * CD_FRAME_BYTES;
    if (needed > file.logical_bytes())
    {
        Errors::raise<Format_error>("tracks need %llu bytes, the image holds %llu",
                                    (unsigned long long)needed, (unsigned long long)file.logical_bytes());
    }
}

uint32_t CDROM_Image::end_lba() const
{
    const CD_Track& last = m_tracks.back();
    return last.start_lba + last.frames;
}

size_t CDROM_Image::track_index_for_lba(uint32_t lba) const
{
    for (size_t i = 0; i < m_tracks.size(); i++)
    {
        const CD_Track& track = m_tracks[i];
        if (lba >= track.start_lba && lba < track.start_lba + track.frames)
            return i;
    }
    Errors::raise<Out_of_range_error>("LBA %u is not inside any track", lba);
}

const CD_Track& CDROM_Image::track_for_lba(uint32_t lba) const
{
    return m_tracks[track_index_for_lba(lba)];
}

MSF_Index CDROM_Image::track_start(uint8_t track) const
{
    if (track == 0)
        return MSF_Index::from_lba(end_lba());
    if (track > m_tracks.size())
        Errors::raise<Out_of_range_error>("track %u requested, the disc has %zu", track, m_tracks.size());

    const CD_Track& info = m_tracks[track - 1];
    return MSF_Index::from_lba(info.start_lba + info.pregap);
}

uint64_t CDROM_Image::frame_offset(uint32_t lba, const CD_Track& track) const
{
    return (uint64_t)(track.chd_frame + (lba - track.start_lba)) * CD_FRAME_BYTES;
}

void CDROM_Image::read_sector(uint32_t lba, uint8_t* dest)
{
    if (lba < CD_FIRST_TRACK_LBA)
    {
        memset(dest, 0, CD_SECTOR_SIZE);
        return;
    }

    const CD_Track& track = track_for_lba(lba);
    std::vector<uint8_t> sector = m_file.read(frame_offset(lba, track), CD_SECTOR_SIZE);
    if (track.type == CD_Track_Type::Audio)
    {
        // CHD keeps audio big-endian
        for (uint32_t i = 0; i < CD_SECTOR_SIZE; i += 2)
            std::swap(sector[i], sector[i + 1]);
    }
    memcpy(dest, sector.data(), CD_SECTOR_SIZE);
}

void CDROM_Image::read_subcode(uint32_t lba, uint8_t* dest)
{
    if (lba < CD_FIRST_TRACK_LBA)
    {
        memset(dest, 0, CD_SUBCODE_SIZE);
        return;
    }

    const CD_Track& track = track_for_lba(lba);
    std::vector<uint8_t> subcode = m_file.read(frame_offset(lba, track) + CD_SECTOR_SIZE, CD_SUBCODE_SIZE);
    memcpy(dest, subcode.data(), CD_SUBCODE_SIZE);
}

void CDROM_Image::read_user_data(uint32_t lba, uint8_t* dest)
{
    const CD_Track& track = track_for_lba(lba);
    if (track.type == CD_Track_Type::Audio)
        Errors::raise<Format_error>("LBA %u is in audio track %u", lba, track.number);

    uint8_t sector[CD_SECTOR_SIZE];
    read_sector(lba, sector);
    memcpy(dest, sector + track.user_data_offset(), CD_USER_DATA_SIZE);
}

std::vector<SHA1_Digest> CDROM_Image::track_sha1s()
{
    std::vector<SHA1_Digest> digests;
    uint8_t sector[CD_SECTOR_SIZE];
    for (const CD_Track& track : m_tracks)
    {
        SHA1_Hasher hasher;
        for (uint32_t frame = 0; frame < track.frames; frame++)
        {
            read_sector(track.start_lba + frame, sector);
            hasher.update(sector, track.data_size());
        }
        digests.push_back(hasher.finish());
    }
    return digests;
}

void CDROM_Image::set_location_lba(uint32_t lba)
{
    if (lba < CD_FIRST_TRACK_LBA)
    {
        m_current_lba = lba;
        m_current_track = 0;
        return;
    }

    size_t index = track_index_for_lba(lba);
    if (index != m_current_track)
        dh_log->cdrom->trace("position moves from track {} to {}", m_current_track + 1, index + 1);
    m_current_lba = lba;
    m_current_track = index;
}

void CDROM_Image::set_location(const MSF_Index& msf)
{
    set_location_lba(msf.to_lba());
}

void CDROM_Image::set_location_to_track(uint8_t track)
{
    set_location(track_start(track));
}

CD_Event CDROM_Image::advance_position()
{
    if (m_current_lba + 1 >= end_lba())
        return CD_Event::End_Of_Disc;

    size_t old_track = m_current_track;
    set_location_lba(m_current_lba + 1);
    return m_current_track != old_track ? CD_Event::Track_Change : CD_Event::None;
}

uint8_t CDROM_Image::current_index() const
{
    const CD_Track& track = m_tracks[m_current_track];
    if (m_current_lba < track.start_lba)
        return 0;
    return (m_current_lba - track.start_lba >= track.pregap) ? 1 : 0;
}

MSF_Index CDROM_Image::current_track_local_msf() const
{
    const CD_Track& track = m_tracks[m_current_track];
    uint32_t index01 = track.start_lba + track.pregap;
    if (m_current_lba < index01)
        return MSF_Index::from_lba(CD_MSF_LIMIT - (index01 - m_current_lba));
    return MSF_Index::from_lba(m_current_lba - index01);
}

MSF_Index CDROM_Image::current_global_msf() const
{
    return MSF_Index::from_lba(m_current_lba);
}

void CDROM_Image::read_current_sector(uint8_t* dest)
{
    read_sector(m_current_lba, dest);
}

void CDROM_Image::read_current_subcode(uint8_t* dest)
{
    read_subcode(m_current_lba, dest);
}

void CDROM_Image::set_invalid_subq_lbas(std::set<uint32_t> lbas)
{
    m_invalid_subq = std::move(lbas);
}

bool CDROM_Image::subchannel_q_valid() const
{
    return m_invalid_subq.count(m_current_lba) == 0;
}
