#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "parabin/tokenizer.hpp"

namespace parabin
{

using TokenId = std::int64_t;

// Symbol <-> index mapping with occurrence counts. The four reserved symbols
// always occupy indices 0..3; every other symbol follows them densely.
class Dictionary
{
  public:
    static constexpr TokenId kBosIndex = 0;
    static constexpr TokenId kPadIndex = 1;
    static constexpr TokenId kEosIndex = 2;
    static constexpr TokenId kUnkIndex = 3;
    static constexpr std::size_t kNumReserved = 4;

    static const char *const kBosWord;
    static const char *const kPadWord;
    static const char *const kEosWord;
    static const char *const kUnkWord;

    Dictionary();

    // Registers symbol when new and bumps its count.
    TokenId add(const std::string &symbol, std::uint64_t n = 1);
    TokenId lookup(const std::string &symbol) const;
    bool contains(const std::string &symbol) const;

    const std::string &symbol(TokenId index) const;
    std::uint64_t count(TokenId index) const;
    std::size_t size() const
    {
        return symbols_.size();
    }

    TokenId bos() const
    {
        return kBosIndex;
    }
    TokenId pad() const
    {
        return kPadIndex;
    }
    TokenId eos() const
    {
        return kEosIndex;
    }
    TokenId unk() const
    {
        return kUnkIndex;
    }
    const std::string &unk_word() const
    {
        return symbols_[kUnkIndex];
    }

    // Unknown-symbol bookkeeping during encoding; never adds symbols.
    void count_unknown(std::uint64_t n)
    {
        counts_[kUnkIndex] += n;
    }

    // Drops non-reserved symbols seen fewer than threshold times, sorts the rest
    // by count (stable), keeps at most max_size of them when max_size >= 0 and
    // renumbers.
    void finalize(std::uint64_t threshold, std::int64_t max_size);

    bool save(const std::string &path, std::uint64_t threshold, std::int64_t max_size, std::string &err);

    static bool load(const std::string &path, Dictionary &out, std::string &err);
    static bool build(const std::string &path, const TokenizeFn &tokenize, Dictionary &out, std::string &err);

  private:
    void rebuild_index();

    std::vector<std::string> symbols_;
    std::vector<std::uint64_t> counts_;
    std::unordered_map<std::string, TokenId> indices_;
};

} // namespace parabin
