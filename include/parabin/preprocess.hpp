#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "parabin/binarizer.hpp"
#include "parabin/config.hpp"
#include "parabin/tokenizer.hpp"

namespace parabin
{

struct SplitPrefix
{
    std::string input_prefix;
    std::string output_name; // train, valid, valid1, ...
};

struct DatasetReport
{
    std::string split;
    std::string lang;
    std::string input_path;
    std::string output_path; // dataset prefix, or the copied file in raw mode
    OutputFormat format = OutputFormat::binary;
    std::size_t dict_size = 0;
    BinarizeStats stats;
};

struct PreprocessResult
{
    std::size_t src_dict_size = 0;
    std::size_t tgt_dict_size = 0;
    std::vector<DatasetReport> datasets;
    bool has_alignment = false;
    std::string alignment_path;
    std::uint64_t alignment_entries = 0;
    std::uint64_t alignment_sentences = 0;
};

// "a,b,c" -> {a, name}, {b, name1}, {c, name2}. Empty entries are skipped.
std::vector<SplitPrefix> expand_split_prefixes(const std::string &list, const std::string &name);

std::string dictionary_path(const Config &cfg, const std::string &lang);
std::string dataset_prefix(const Config &cfg, const std::string &split, const std::string &lang);
std::string alignment_output_path(const Config &cfg);

bool run_preprocess(const Config &cfg, const TokenizeFn &tokenize, PreprocessResult &result, std::string &err);
bool write_meta_json(const std::string &path, const Config &cfg, const PreprocessResult &result, std::string &err);

// Entry point shared by the ParaBinPreprocess binary.
int run_preprocess_main(int argc, char **argv);

} // namespace parabin
