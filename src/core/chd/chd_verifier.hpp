#ifndef CHD_VERIFIER_HPP
#define CHD_VERIFIER_HPP
#include <cstdint>
#include "checksum.hpp"

class CHD_File;
class CHD_Metadata;
struct Hunk_Entry;

class CHD_Verifier
{
    public:
        //True if the entry carries no check value or the value matches
        static bool check_hunk(const uint8_t* data, uint32_t length, const Hunk_Entry& entry);

        //Throws Integrity_error naming the hunk
        static void verify_hunk(uint32_t hunk, const uint8_t* data, uint32_t length, const Hunk_Entry& entry);

        /*
        Decodes every hunk straight from the source (the cache is left alone), checks each
        stored CRC, then compares the raw SHA-1 and, for v4/v5, the combined SHA-1.
        Throws Integrity_error listing every hunk that failed.
        */
        static void verify_image(CHD_File& file);

        //SHA-1 of the raw digest followed by the sorted tag+SHA-1 records of checksummed metadata
        static SHA1_Digest combined_sha1(const SHA1_Digest& raw_sha1, const CHD_Metadata& metadata);
};

#endif // CHD_VERIFIER_HPP
