#include <gtest/gtest.h>
#include "test_image.hpp"
#include "../../chd/bytes.hpp"
#include "../../chd/chd_file.hpp"
#include "../../chd/chd_metadata.hpp"
#include "../../chd/chd_verifier.hpp"
#include "../../chd/parent_locator.hpp"
#include "../../errors.hpp"

namespace
{

Test_Image image_with_metadata(uint32_t version)
{
    Test_Image image(version, 2048);
    for (uint32_t i = 0; i < 4; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(2048, i + 20);
        image.add_compressed(0, stored_deflate(data), data);
    }
    image.add_self(1);
    image.add_metadata(HARD_DISK_METADATA_TAG, 0, "CYLS:10,HEADS:4,SECS:32,BPS:512");
    image.add_metadata(CDROM_TRACK_METADATA2_TAG, CHD_MDFLAGS_CHECKSUM,
                       "TRACK:1 TYPE:MODE1_RAW SUBTYPE:NONE FRAMES:4 PREGAP:0 PGTYPE:MODE1 PGSUB:NONE POSTGAP:0");
    return image;
}

std::vector<uint32_t> bad_hunks(CHD_File& file)
{
    try
    {
        CHD_Verifier::verify_image(file);
    }
    catch (Integrity_error& e)
    {
        return e.hunks();
    }
    ADD_FAILURE() << "verification passed";
    return {};
}

std::unique_ptr<CHD_File> open_bytes(const std::vector<uint8_t>& bytes)
{
    return CHD_File::open(Test_Image::source(bytes));
}

}

TEST(Verifier, GoodImagesPass)
{
    for (uint32_t version : {3u, 4u, 5u})
    {
        Test_Image image = image_with_metadata(version);
        std::unique_ptr<CHD_File> file = open_bytes(image.build());
        EXPECT_NO_THROW(CHD_Verifier::verify_image(*file)) << "v" << version;

        //whole-image checks go around the cache
        EXPECT_EQ(0u, file->cache().resident());
    }
}

TEST(Verifier, CombinedDigestCoversChecksummedMetadata)
{
    Test_Image image = image_with_metadata(5);
    std::unique_ptr<CHD_File> file = open_bytes(image.build());

    EXPECT_EQ(image.sha1(), CHD_Verifier::combined_sha1(image.raw_sha1(), file->metadata()));
    EXPECT_NE(image.raw_sha1(), image.sha1());
}

TEST(Verifier, ListsEveryDamagedHunk)
{
    Test_Image image = image_with_metadata(5);
    std::vector<uint8_t> bytes = image.build();
    bytes[image.data_offset(1) + 5] ^= 0x40;
    bytes[image.data_offset(3) + 100] ^= 0x02;

    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    EXPECT_EQ((std::vector<uint32_t>{1, 3}), bad_hunks(*file));
}

TEST(Verifier, UndecodableHunksAreDamaged)
{
    Test_Image image(5, 2048);
    std::vector<uint8_t> data = pattern_hunk(2048, 1);
    image.add_compressed(0, stored_deflate(data), data);
    image.add_compressed(0, std::vector<uint8_t>(32, 0xFF), data);
    image.add_compressed(0, stored_deflate(data), data);

    std::unique_ptr<CHD_File> file = open_bytes(image.build());
    EXPECT_EQ(std::vector<uint32_t>{1}, bad_hunks(*file));
}

TEST(Verifier, V4DamageFoundByCRC32)
{
    Test_Image image = image_with_metadata(4);
    std::vector<uint8_t> bytes = image.build();
    bytes[image.data_offset(2) + 5] ^= 0x01;

    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    EXPECT_EQ(std::vector<uint32_t>{2}, bad_hunks(*file));
}

TEST(Verifier, RawDigestMismatch)
{
    Test_Image image = image_with_metadata(5);
    std::vector<uint8_t> bytes = image.build();
    bytes[64] ^= 0xFF;

    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    EXPECT_TRUE(bad_hunks(*file).empty());
}

TEST(Verifier, V3DigestMismatch)
{
    Test_Image image = image_with_metadata(3);
    std::vector<uint8_t> bytes = image.build();
    bytes[80] ^= 0xFF;

    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    EXPECT_TRUE(bad_hunks(*file).empty());
}

TEST(Verifier, ChangedMetadataBreaksCombinedDigest)
{
    Test_Image image = image_with_metadata(5);
    std::vector<uint8_t> bytes = image.build();

    //the checksummed CHT2 record is last; change a character before its NUL
    bytes[bytes.size() - 2] = '1';
    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    EXPECT_THROW(CHD_Verifier::verify_image(*file), Integrity_error);
}

TEST(Verifier, UnchecksummedMetadataIsIgnored)
{
    Test_Image image = image_with_metadata(5);
    std::vector<uint8_t> bytes = image.build();

    std::unique_ptr<CHD_File> original = open_bytes(bytes);
    uint64_t offset = original->metadata().find(HARD_DISK_METADATA_TAG).offset;
    bytes[offset + CHD_METADATA_HEADER_SIZE] = 'X';

    std::unique_ptr<CHD_File> file = open_bytes(bytes);
    EXPECT_EQ('X', file->metadata().find(HARD_DISK_METADATA_TAG).data[0]);
    EXPECT_NO_THROW(CHD_Verifier::verify_image(*file));
}

TEST(Verifier, ChildWithParent)
{
    Test_Image parent(5, 2048);
    for (uint32_t i = 0; i < 3; i++)
    {
        std::vector<uint8_t> data = pattern_hunk(2048, i + 50);
        parent.add_compressed(0, stored_deflate(data), data);
    }
    std::vector<uint8_t> parent_bytes = parent.build();
    std::vector<uint8_t> parent_data = parent.logical_data();

    Test_Image child(5, 2048);
    child.set_parent(parent.sha1());
    std::vector<uint8_t> own = pattern_hunk(2048, 77);
    child.add_compressed(0, stored_deflate(own), own);
    child.add_parent(2, std::vector<uint8_t>(parent_data.begin() + 2 * 2048, parent_data.end()));

    class Single_Locator : public Parent_Locator
    {
        public:
            Single_Locator(const std::vector<uint8_t>& bytes) : m_bytes(bytes) {}
            std::unique_ptr<Byte_Source> open_parent(const SHA1_Digest&) override { return Test_Image::source(m_bytes); }
        private:
            std::vector<uint8_t> m_bytes;
    };
    Single_Locator locator(parent_bytes);

    std::unique_ptr<CHD_File> file = CHD_File::open(Test_Image::source(child.build()), CHD_Options(), &locator);
    EXPECT_NO_THROW(CHD_Verifier::verify_image(*file));
    EXPECT_EQ(0u, file->parent()->cache().resident());
}
