#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "parabin/dictionary.hpp"
#include "parabin/tokenizer.hpp"

namespace parabin
{

class ProgressTracker;

struct AlignmentPair
{
    std::size_t src = 0;
    std::size_t tgt = 0;
};

// source index -> (target index -> co-occurrence count). Ordered so that the
// emitted table is ascending by source index.
using AlignmentFrequencyTable = std::map<TokenId, std::map<TokenId, std::uint64_t>>;

// Parses "i-j i-j ..." into 0-based position pairs.
bool parse_alignment_line(const std::string &line, std::vector<AlignmentPair> &pairs, std::string &err);

// Counts aligned (source word, target word) index pairs over a parallel corpus
// and reduces them to one best target per source index.
class AlignmentAggregator
{
  public:
    AlignmentAggregator(const Dictionary &src_dict, const Dictionary &tgt_dict,
                        TokenizeFn tokenize = default_tokenizer());

    // One sentence pair. On failure err describes the offending pair but not
    // its file position.
    bool add_sentence(const std::string &src_line, const std::string &tgt_line, const std::string &align_line,
                      std::string &err);

    // Reads the three files in lockstep. All three must have the same number
    // of lines.
    bool aggregate(const std::string &src_path, const std::string &tgt_path, const std::string &align_path,
                   std::string &err, ProgressTracker *progress = nullptr);

    // Highest count wins; ties go to the lowest target index.
    std::vector<std::pair<TokenId, TokenId>> best_alignment() const;

    bool write(const std::string &path, std::string &err) const;

    const AlignmentFrequencyTable &frequencies() const
    {
        return freq_;
    }
    std::uint64_t sentences() const
    {
        return sentences_;
    }
    std::uint64_t counted_pairs() const
    {
        return counted_pairs_;
    }
    std::uint64_t skipped_unknown() const
    {
        return skipped_unknown_;
    }

  private:
    const Dictionary &src_dict_;
    const Dictionary &tgt_dict_;
    TokenizeFn tokenize_;
    AlignmentFrequencyTable freq_;
    std::vector<AlignmentPair> pairs_;
    std::uint64_t sentences_ = 0;
    std::uint64_t counted_pairs_ = 0;
    std::uint64_t skipped_unknown_ = 0;
};

} // namespace parabin
