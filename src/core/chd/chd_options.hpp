#ifndef CHD_OPTIONS_HPP
#define CHD_OPTIONS_HPP
#include <cstdint>

class Codec_Registry;

struct CHD_Options
{
    //Decoded hunks kept per image. 0 turns the cache into a pass-through.
    uint32_t cache_hunks = 16;

    //Parents allowed above the opened image before we give up
    uint32_t max_parent_depth = 10;

    //Check each hunk's stored CRC as it is decoded
    bool verify_hunks = false;

    //Lock the cache and collapse concurrent decodes of the same hunk.
    //Turn off only if a single thread ever touches the image.
    bool multithreaded = true;

    //Null means Codec_Registry::defaults(). Copied at open.
    const Codec_Registry* codecs = nullptr;
};

#endif // CHD_OPTIONS_HPP
