#ifndef SBI_HPP
#define SBI_HPP
#include <cstdint>
#include <set>
#include <string>
#include <vector>

/*
SBI files list the sectors of a protected PlayStation disc whose subchannel Q
doesn't match what the drive would generate. After the "SBI\0" magic come records of
BCD minute, second, frame and a format byte, which decides how much Q data follows.
*/
#define SBI_MAGIC "SBI"
#define SBI_MAGIC_SIZE 4

//Absolute LBAs with replaced Q data. Throws Format_error.
std::set<uint32_t> parse_sbi(const std::vector<uint8_t>& data);

//Throws Source_io_error if the file can't be read
std::set<uint32_t> load_sbi_file(const std::string& path);

#endif // SBI_HPP
