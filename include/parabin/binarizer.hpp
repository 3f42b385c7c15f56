#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "parabin/dictionary.hpp"
#include "parabin/tokenizer.hpp"

namespace parabin
{

class ProgressTracker;

// Receives one encoded line. Returning false aborts binarization; err carries
// the reason back to the caller.
using SequenceConsumer = std::function<bool(const std::vector<TokenId> &ids, std::string &err)>;

struct BinarizeStats
{
    std::uint64_t sentences = 0;
    // Includes the trailing end-of-sequence element of every line.
    std::uint64_t tokens = 0;
    std::uint64_t unknown = 0;
    std::uint64_t replaced_types = 0;

    double unknown_percent() const
    {
        return tokens == 0 ? 0.0 : 100.0 * static_cast<double>(unknown) / static_cast<double>(tokens);
    }
};

// Maps words to indices and appends end-of-sequence. With extend_vocabulary
// unseen words are added to dict; otherwise they become the unknown index.
// When replaced is non-null, every word that fell back to the unknown index is
// reported through it (the literal unknown symbol itself is not).
std::vector<TokenId> encode_line(const std::string &line, const TokenizeFn &tokenize, Dictionary &dict,
                                 bool extend_vocabulary,
                                 const std::function<void(const std::string &word)> &replaced = nullptr);

// Same as encode_line without vocabulary extension or bookkeeping.
std::vector<TokenId> encode_line(const std::string &line, const TokenizeFn &tokenize, const Dictionary &dict);

bool binarize(const std::string &path, Dictionary &dict, const SequenceConsumer &consumer, bool extend_vocabulary,
              const TokenizeFn &tokenize, BinarizeStats &stats, std::string &err,
              ProgressTracker *progress = nullptr);

} // namespace parabin
