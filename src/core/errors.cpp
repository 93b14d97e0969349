#include "errors.hpp"
#include "logger.hpp"
#include <cstdio>

std::string Errors::vformat(const char* format, va_list args)
{
    char output[ERROR_STRING_MAX_LENGTH];
    vsnprintf(output, ERROR_STRING_MAX_LENGTH, format, args);
    return std::string(output);
}

[[ noreturn ]] void Errors::integrity(std::vector<uint32_t> hunks, const char* format, ...)
{
    va_list args;
    va_start(args, format);
    std::string output = vformat(format, args);
    va_end(args);
    dh_log->verify->error(output);
    throw Integrity_error(output, std::move(hunks));
}

void Errors::print_warning(const char* format, ...)
{
    /*Used for problems we can step over, such as an unusable parent candidate.
    The caller decides what happens next*/
    va_list args;
    va_start(args, format);
    std::string output = vformat(format, args);
    va_end(args);
    dh_log->main->warn(output);
}
