#include "chd_verifier.hpp"
#include "bytes.hpp"
#include "chd_file.hpp"
#include "chd_metadata.hpp"
#include "hunk_decoder.hpp"
#include "hunk_map.hpp"
#include "../errors.hpp"
#include "../logger.hpp"

#include <algorithm>
#include <array>
#include <cstring>

bool CHD_Verifier::check_hunk(const uint8_t* data, uint32_t length, const Hunk_Entry& entry)
{
    switch (entry.check_kind)
    {
        case Check_Kind::CRC16:
            return crc16(data, length) == entry.check;
        case Check_Kind::CRC32:
            return crc32(data, length) == entry.check;
        case Check_Kind::None:
            break;
    }
    return true;
}

void CHD_Verifier::verify_hunk(uint32_t hunk, const uint8_t* data, uint32_t length, const Hunk_Entry& entry)
{
    if (!check_hunk(data, length, entry))
        Errors::integrity({hunk}, "hunk %u failed its CRC check", hunk);
}

SHA1_Digest CHD_Verifier::combined_sha1(const SHA1_Digest& raw_sha1, const CHD_Metadata& metadata)
{
    //tag (4 bytes, big-endian) followed by the SHA-1 of the entry's data
    typedef std::array<uint8_t, 24> Meta_Hash;
    std::vector<Meta_Hash> hashes;
    for (const Metadata_Entry& entry : metadata.entries())
    {
        if (!(entry.flags & CHD_MDFLAGS_CHECKSUM))
            continue;
        Meta_Hash record;
        put_be32(record.data(), entry.tag);
        SHA1_Digest digest = SHA1_Hasher::digest(entry.data.data(), entry.data.size());
        std::copy(digest.begin(), digest.end(), record.begin() + 4);
        hashes.push_back(record);
    }
    std::sort(hashes.begin(), hashes.end());

    SHA1_Hasher hasher;
    hasher.update(raw_sha1.data(), raw_sha1.size());
    for (const Meta_Hash& record : hashes)
        hasher.update(record.data(), record.size());
    return hasher.finish();
}

void CHD_Verifier::verify_image(CHD_File& file)
{
    const CHD_Header& header = file.header();
    std::vector<uint8_t> buffer(header.hunk_bytes);
    std::vector<uint8_t> previous(header.hunk_bytes);
    bool have_previous = false;
    std::vector<uint32_t> bad_hunks;
    SHA1_Hasher hasher;

    dh_log->verify->info("verifying {} hunks", header.hunk_count);
    uint64_t remaining = header.logical_bytes;
    for (uint32_t hunk = 0; hunk < header.hunk_count; hunk++)
    {
        try
        {
            file.m_decoder->decode_unchecked(hunk, buffer.data(), have_previous ? previous.data() : nullptr);
        }
        catch (Codec_error& e)
        {
            dh_log->verify->error("hunk {} failed to decode: {}", hunk, e.what());
            bad_hunks.push_back(hunk);
            have_previous = false;
            continue;
        }
        catch (Size_mismatch_error& e)
        {
            dh_log->verify->error("hunk {} failed to decode: {}", hunk, e.what());
            bad_hunks.push_back(hunk);
            have_previous = false;
            continue;
        }
        catch (Resolution_cycle_error& e)
        {
            dh_log->verify->error("hunk {} can't be resolved: {}", hunk, e.what());
            bad_hunks.push_back(hunk);
            have_previous = false;
            continue;
        }

        if (!check_hunk(buffer.data(), header.hunk_bytes, file.map()[hunk]))
        {
            dh_log->verify->error("hunk {} failed its CRC check", hunk);
            bad_hunks.push_back(hunk);
        }

        uint64_t count = std::min<uint64_t>(header.hunk_bytes, remaining);
        hasher.update(buffer.data(), count);
        remaining -= count;

        buffer.swap(previous);
        have_previous = true;
    }

    if (!bad_hunks.empty())
        Errors::integrity(bad_hunks, "%zu of %u hunks are damaged", bad_hunks.size(), header.hunk_count);

    SHA1_Digest raw = hasher.finish();
    if (raw != header.raw_sha1)
    {
        Errors::integrity({}, "raw SHA-1 mismatch: computed %s, header says %s",
                          sha1_to_string(raw).c_str(), sha1_to_string(header.raw_sha1).c_str());
    }

    if (header.version >= 4)
    {
        SHA1_Digest combined = combined_sha1(raw, file.metadata());
        if (combined != header.sha1)
        {
            Errors::integrity({}, "SHA-1 mismatch: computed %s, header says %s",
                              sha1_to_string(combined).c_str(), sha1_to_string(header.sha1).c_str());
        }
    }
    dh_log->verify->info("image {} verified", sha1_to_string(header.sha1));
}
