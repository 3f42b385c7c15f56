#include "parabin/dictionary.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

#include "parabin/line_reader.hpp"

namespace parabin
{

const char *const Dictionary::kBosWord = "<s>";
const char *const Dictionary::kPadWord = "<pad>";
const char *const Dictionary::kEosWord = "</s>";
const char *const Dictionary::kUnkWord = "<unk>";

namespace
{
bool has_space(const std::string &s)
{
    return std::any_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

bool parse_count(const std::string &s, std::uint64_t &out)
{
    if (s.empty())
    {
        return false;
    }
    std::uint64_t v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
        {
            return false;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
        {
            return false;
        }
        v = v * 10 + digit;
    }
    out = v;
    return true;
}
} // namespace

Dictionary::Dictionary()
{
    symbols_ = {kBosWord, kPadWord, kEosWord, kUnkWord};
    counts_.assign(kNumReserved, 0);
    rebuild_index();
}

TokenId Dictionary::add(const std::string &symbol, std::uint64_t n)
{
    auto it = indices_.find(symbol);
    if (it != indices_.end())
    {
        counts_[static_cast<std::size_t>(it->second)] += n;
        return it->second;
    }
    TokenId idx = static_cast<TokenId>(symbols_.size());
    symbols_.push_back(symbol);
    counts_.push_back(n);
    indices_.emplace(symbol, idx);
    return idx;
}

TokenId Dictionary::lookup(const std::string &symbol) const
{
    auto it = indices_.find(symbol);
    return it == indices_.end() ? kUnkIndex : it->second;
}

bool Dictionary::contains(const std::string &symbol) const
{
    return indices_.find(symbol) != indices_.end();
}

const std::string &Dictionary::symbol(TokenId index) const
{
    if (index < 0 || static_cast<std::size_t>(index) >= symbols_.size())
    {
        return symbols_[kUnkIndex];
    }
    return symbols_[static_cast<std::size_t>(index)];
}

std::uint64_t Dictionary::count(TokenId index) const
{
    if (index < 0 || static_cast<std::size_t>(index) >= counts_.size())
    {
        return 0;
    }
    return counts_[static_cast<std::size_t>(index)];
}

void Dictionary::finalize(std::uint64_t threshold, std::int64_t max_size)
{
    std::vector<std::size_t> order;
    order.reserve(symbols_.size() - kNumReserved);
    for (std::size_t i = kNumReserved; i < symbols_.size(); ++i)
    {
        if (threshold == 0 || counts_[i] >= threshold)
        {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return counts_[a] > counts_[b]; });
    if (max_size >= 0 && order.size() > static_cast<std::uint64_t>(max_size))
    {
        order.resize(static_cast<std::size_t>(max_size));
    }

    std::vector<std::string> symbols(symbols_.begin(), symbols_.begin() + kNumReserved);
    std::vector<std::uint64_t> counts(counts_.begin(), counts_.begin() + kNumReserved);
    symbols.reserve(kNumReserved + order.size());
    counts.reserve(kNumReserved + order.size());
    for (std::size_t i : order)
    {
        symbols.push_back(std::move(symbols_[i]));
        counts.push_back(counts_[i]);
    }
    symbols_.swap(symbols);
    counts_.swap(counts);
    rebuild_index();
}

bool Dictionary::save(const std::string &path, std::uint64_t threshold, std::int64_t max_size, std::string &err)
{
    finalize(threshold, max_size);
    for (std::size_t i = kNumReserved; i < symbols_.size(); ++i)
    {
        if (symbols_[i].empty() || has_space(symbols_[i]))
        {
            err = "cannot persist symbol with whitespace or empty text at index " + std::to_string(i) + ": " + path;
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "failed to open dictionary for write: " + path;
        return false;
    }
    for (std::size_t i = kNumReserved; i < symbols_.size(); ++i)
    {
        out << symbols_[i] << ' ' << counts_[i] << '\n';
    }
    out.flush();
    if (!out)
    {
        err = "failed to write dictionary: " + path;
        return false;
    }
    return true;
}

bool Dictionary::load(const std::string &path, Dictionary &out, std::string &err)
{
    Dictionary d;
    bool ok = for_each_line(
        path,
        [&](const std::string &line, std::uint64_t line_no, std::string &line_err) {
            auto fields = split_whitespace_words(line);
            std::uint64_t cnt = 0;
            if (fields.size() != 2 || !parse_count(fields[1], cnt))
            {
                line_err = "malformed dictionary line " + std::to_string(line_no) + " (expected '<symbol> <count>'): " +
                           path;
                return false;
            }
            if (d.contains(fields[0]))
            {
                line_err = "duplicate symbol '" + fields[0] + "' at dictionary line " + std::to_string(line_no) + ": " +
                           path;
                return false;
            }
            d.add(fields[0], cnt);
            return true;
        },
        err);
    if (!ok)
    {
        return false;
    }
    out = std::move(d);
    return true;
}

bool Dictionary::build(const std::string &path, const TokenizeFn &tokenize, Dictionary &out, std::string &err)
{
    Dictionary d;
    bool ok = for_each_line(
        path,
        [&](const std::string &line, std::uint64_t, std::string &) {
            for (const auto &word : tokenize(line))
            {
                d.add(word);
            }
            d.add(kEosWord);
            return true;
        },
        err);
    if (!ok)
    {
        return false;
    }
    out = std::move(d);
    return true;
}

void Dictionary::rebuild_index()
{
    indices_.clear();
    indices_.reserve(symbols_.size());
    for (std::size_t i = 0; i < symbols_.size(); ++i)
    {
        indices_.emplace(symbols_[i], static_cast<TokenId>(i));
    }
}

} // namespace parabin
