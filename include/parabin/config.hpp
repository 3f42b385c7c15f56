#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "parabin/indexed_dataset.hpp"

namespace parabin
{

enum class OutputFormat
{
    binary = 0,
    raw
};

struct Config
{
    std::string env_path = ".env";
    std::string source_lang;
    std::string target_lang;
    std::string train_pref = "train";
    std::string valid_pref = "valid"; // comma separated
    std::string test_pref = "test";   // comma separated
    std::string dest_dir = "data-bin";
    std::uint64_t threshold_src = 0;
    std::uint64_t threshold_tgt = 0;
    std::int64_t nwords_src = -1; // -1 -> keep all
    std::int64_t nwords_tgt = -1;
    std::string src_dict;
    std::string tgt_dict;
    std::string align_file;
    OutputFormat output_format = OutputFormat::binary;
    DataType dtype = DataType::int32;
    std::size_t progress_interval_ms = 1000;
};

std::string output_format_to_string(OutputFormat format);
bool parse_output_format(const std::string &text, OutputFormat &format);

std::unordered_map<std::string, std::string> read_env_file(const std::string &path);
void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env);

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path = ".env");
void print_preprocess_usage();
bool parse_preprocess_args(int argc, char **argv, Config &cfg, std::string &err, bool &show_help);

} // namespace parabin
