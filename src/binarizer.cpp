#include "parabin/binarizer.hpp"

#include <unordered_set>

#include "parabin/line_reader.hpp"
#include "parabin/progress.hpp"

namespace parabin
{

std::vector<TokenId> encode_line(const std::string &line, const TokenizeFn &tokenize, Dictionary &dict,
                                 bool extend_vocabulary, const std::function<void(const std::string &word)> &replaced)
{
    auto words = tokenize(line);
    std::vector<TokenId> ids;
    ids.reserve(words.size() + 1);
    for (const auto &word : words)
    {
        TokenId idx = extend_vocabulary ? dict.add(word) : dict.lookup(word);
        if (idx == dict.unk() && word != dict.unk_word() && replaced)
        {
            replaced(word);
        }
        ids.push_back(idx);
    }
    ids.push_back(dict.eos());
    return ids;
}

std::vector<TokenId> encode_line(const std::string &line, const TokenizeFn &tokenize, const Dictionary &dict)
{
    auto words = tokenize(line);
    std::vector<TokenId> ids;
    ids.reserve(words.size() + 1);
    for (const auto &word : words)
    {
        ids.push_back(dict.lookup(word));
    }
    ids.push_back(dict.eos());
    return ids;
}

bool binarize(const std::string &path, Dictionary &dict, const SequenceConsumer &consumer, bool extend_vocabulary,
              const TokenizeFn &tokenize, BinarizeStats &stats, std::string &err, ProgressTracker *progress)
{
    stats = BinarizeStats{};
    std::unordered_set<std::string> replaced_words;
    auto on_replaced = [&](const std::string &word) {
        ++stats.unknown;
        replaced_words.insert(word);
    };

    constexpr std::uint64_t report_lines_batch = 128;
    std::uint64_t pending_report = 0;
    bool ok = for_each_line(
        path,
        [&](const std::string &line, std::uint64_t line_no, std::string &line_err) {
            auto ids = encode_line(line, tokenize, dict, extend_vocabulary, on_replaced);
            if (!consumer(ids, line_err))
            {
                line_err += " (line " + std::to_string(line_no) + " of " + path + ")";
                return false;
            }
            ++stats.sentences;
            stats.tokens += static_cast<std::uint64_t>(ids.size());
            ++pending_report;
            if (progress && pending_report >= report_lines_batch)
            {
                progress->add(0, pending_report);
                pending_report = 0;
            }
            return true;
        },
        err);
    if (progress && pending_report > 0)
    {
        progress->add(0, pending_report);
    }
    if (!ok)
    {
        return false;
    }
    stats.replaced_types = static_cast<std::uint64_t>(replaced_words.size());
    dict.count_unknown(stats.unknown);
    return true;
}

} // namespace parabin
