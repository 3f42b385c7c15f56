#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace parabin
{

struct DumpArgs
{
    std::string prefix;
    std::string dict_path;
    std::uint64_t start = 0;
    std::uint64_t count = 0; // 0 -> all
    bool header_only = false;
};

void print_dump_usage();
bool parse_dump_args(int argc, char **argv, DumpArgs &args, std::string &err, bool &show_help);

// Writes the header lines and then "<i>\t<len>\t<values>" for every item in
// [start, start + count), clamped to the dataset size.
bool dump_dataset(const DumpArgs &args, std::ostream &out, std::string &err);

int run_dump_main(int argc, char **argv);

} // namespace parabin
