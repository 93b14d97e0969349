#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdarg>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define ERROR_STRING_MAX_LENGTH 255

class CHD_Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

//Header is malformed or declares something we can't read
class Format_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Unsupported_version_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

//Source is shorter than the header/map says it should be
class Truncated_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Index_corrupt_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Resolution_cycle_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Parent_cycle_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Parent_chain_too_deep_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Parent_not_found_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Size_mismatch_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Out_of_range_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Codec_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Source_io_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Metadata_not_found_error : public CHD_Error
{
    using CHD_Error::CHD_Error;
};

class Integrity_error : public CHD_Error
{
    public:
        Integrity_error(const std::string& what, std::vector<uint32_t> hunks)
            : CHD_Error(what), bad_hunks(std::move(hunks)) {}

        //Hunks whose stored check value didn't match. Empty if only the image digest failed.
        const std::vector<uint32_t>& hunks() const { return bad_hunks; }
    private:
        std::vector<uint32_t> bad_hunks;
};

class Errors
{
    public:
        //Formats like printf and throws E with the result
        template <typename E>
        [[ noreturn ]] static void raise(const char* format, ...);

        [[ noreturn ]] static void integrity(std::vector<uint32_t> hunks, const char* format, ...);
        static void print_warning(const char* format, ...);//log it and carry on
    private:
        static std::string vformat(const char* format, va_list args);
};

template <typename E>
[[ noreturn ]] void Errors::raise(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    std::string output = vformat(format, args);
    va_end(args);
    throw E(output);
}

#endif
