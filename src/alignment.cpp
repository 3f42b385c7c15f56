#include "parabin/alignment.hpp"

#include <fstream>
#include <limits>

#include "parabin/binarizer.hpp"
#include "parabin/line_reader.hpp"
#include "parabin/progress.hpp"

namespace parabin
{

namespace
{
bool parse_position(const std::string &s, std::size_t begin, std::size_t end, std::size_t &out)
{
    if (begin >= end)
    {
        return false;
    }
    std::size_t v = 0;
    for (std::size_t i = begin; i < end; ++i)
    {
        char c = s[i];
        if (c < '0' || c > '9')
        {
            return false;
        }
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (v > (std::numeric_limits<std::size_t>::max() - digit) / 10)
        {
            return false;
        }
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

std::uint64_t drain(LineReader &reader)
{
    std::string line;
    while (reader.next(line))
    {
    }
    return reader.line_number();
}
} // namespace

bool parse_alignment_line(const std::string &line, std::vector<AlignmentPair> &pairs, std::string &err)
{
    pairs.clear();
    for (const auto &token : split_whitespace_words(line))
    {
        std::size_t dash = token.find('-');
        AlignmentPair p;
        if (dash == std::string::npos || !parse_position(token, 0, dash, p.src) ||
            !parse_position(token, dash + 1, token.size(), p.tgt))
        {
            err = "malformed alignment pair '" + token + "' (expected '<src>-<tgt>')";
            return false;
        }
        pairs.push_back(p);
    }
    return true;
}

AlignmentAggregator::AlignmentAggregator(const Dictionary &src_dict, const Dictionary &tgt_dict, TokenizeFn tokenize)
    : src_dict_(src_dict), tgt_dict_(tgt_dict), tokenize_(std::move(tokenize))
{
}

bool AlignmentAggregator::add_sentence(const std::string &src_line, const std::string &tgt_line,
                                       const std::string &align_line, std::string &err)
{
    if (!parse_alignment_line(align_line, pairs_, err))
    {
        return false;
    }
    auto src_ids = encode_line(src_line, tokenize_, src_dict_);
    auto tgt_ids = encode_line(tgt_line, tokenize_, tgt_dict_);

    for (const auto &p : pairs_)
    {
        const std::string pair_text = std::to_string(p.src) + "-" + std::to_string(p.tgt);
        // Position == word count resolves to the trailing end-of-sequence.
        if (p.src >= src_ids.size() || p.tgt >= tgt_ids.size())
        {
            err = "alignment pair " + pair_text + " out of range (source words=" + std::to_string(src_ids.size() - 1) +
                  ", target words=" + std::to_string(tgt_ids.size() - 1) + ")";
            return false;
        }
        TokenId src_idx = src_ids[p.src];
        TokenId tgt_idx = tgt_ids[p.tgt];
        if (src_idx == src_dict_.unk() || tgt_idx == tgt_dict_.unk())
        {
            ++skipped_unknown_;
            continue;
        }
        if (src_idx == src_dict_.pad() || src_idx == src_dict_.eos() || tgt_idx == tgt_dict_.pad() ||
            tgt_idx == tgt_dict_.eos())
        {
            err = "alignment pair " + pair_text + " resolves to a pad or end-of-sequence symbol";
            return false;
        }
        ++freq_[src_idx][tgt_idx];
        ++counted_pairs_;
    }
    ++sentences_;
    return true;
}

bool AlignmentAggregator::aggregate(const std::string &src_path, const std::string &tgt_path,
                                    const std::string &align_path, std::string &err, ProgressTracker *progress)
{
    LineReader src_reader;
    LineReader tgt_reader;
    LineReader align_reader;
    if (!src_reader.open(src_path, err) || !tgt_reader.open(tgt_path, err) || !align_reader.open(align_path, err))
    {
        return false;
    }

    constexpr std::uint64_t report_lines_batch = 128;
    std::uint64_t pending_report = 0;
    std::string src_line;
    std::string tgt_line;
    std::string align_line;
    while (true)
    {
        bool has_src = src_reader.next(src_line);
        bool has_tgt = tgt_reader.next(tgt_line);
        bool has_align = align_reader.next(align_line);
        for (const LineReader *r : {&src_reader, &tgt_reader, &align_reader})
        {
            if (!r->error().empty())
            {
                err = r->error();
                return false;
            }
        }
        if (!has_src && !has_tgt && !has_align)
        {
            break;
        }
        if (!has_src || !has_tgt || !has_align)
        {
            std::uint64_t n_src = drain(src_reader);
            std::uint64_t n_tgt = drain(tgt_reader);
            std::uint64_t n_align = drain(align_reader);
            err = "line count mismatch: " + src_path + " has " + std::to_string(n_src) + " lines, " + tgt_path +
                  " has " + std::to_string(n_tgt) + " lines, " + align_path + " has " + std::to_string(n_align) +
                  " lines";
            return false;
        }
        if (!add_sentence(src_line, tgt_line, align_line, err))
        {
            err += " at line " + std::to_string(align_reader.line_number()) + " of " + align_path;
            return false;
        }
        ++pending_report;
        if (progress && pending_report >= report_lines_batch)
        {
            progress->add(0, pending_report);
            pending_report = 0;
        }
    }
    if (progress && pending_report > 0)
    {
        progress->add(0, pending_report);
    }
    return true;
}

std::vector<std::pair<TokenId, TokenId>> AlignmentAggregator::best_alignment() const
{
    std::vector<std::pair<TokenId, TokenId>> out;
    out.reserve(freq_.size());
    for (const auto &kv : freq_)
    {
        TokenId best = 0;
        std::uint64_t best_count = 0;
        // Inner map is ascending, so strict > keeps the lowest index on ties.
        for (const auto &cand : kv.second)
        {
            if (cand.second > best_count)
            {
                best = cand.first;
                best_count = cand.second;
            }
        }
        out.emplace_back(kv.first, best);
    }
    return out;
}

bool AlignmentAggregator::write(const std::string &path, std::string &err) const
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "failed to open alignment output: " + path;
        return false;
    }
    for (const auto &kv : best_alignment())
    {
        out << src_dict_.symbol(kv.first) << ' ' << tgt_dict_.symbol(kv.second) << '\n';
    }
    out.flush();
    if (!out)
    {
        err = "failed to write alignment output: " + path;
        return false;
    }
    return true;
}

} // namespace parabin
