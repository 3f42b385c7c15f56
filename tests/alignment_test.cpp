#include <cassert>
#include <string>
#include <vector>

#include "parabin/alignment.hpp"
#include "parabin/dictionary.hpp"
#include "test_util.hpp"

namespace
{
parabin::Dictionary dict_of(const std::vector<std::string> &words)
{
    parabin::Dictionary d;
    for (const auto &w : words)
    {
        d.add(w);
    }
    return d;
}
} // namespace

int main()
{
    using namespace parabin;
    parabin_test::TempDir tmp("alignment");
    std::string err;

    {
        std::vector<AlignmentPair> pairs;
        assert(parse_alignment_line(" 0-0  2-13\t", pairs, err));
        assert(pairs.size() == 2);
        assert(pairs[1].src == 2 && pairs[1].tgt == 13);
        assert(parse_alignment_line("", pairs, err));
        assert(pairs.empty());
        for (const char *bad : {"0-", "-1", "1:2", "a-b", "1-2-3", "0-0 x"})
        {
            err.clear();
            assert(!parse_alignment_line(bad, pairs, err));
            assert(err.find("malformed") != std::string::npos);
        }
    }

    Dictionary src = dict_of({"a", "b"});
    Dictionary tgt = dict_of({"x", "y"});
    const TokenId a = src.lookup("a");
    const TokenId b = src.lookup("b");
    const TokenId x = tgt.lookup("x");
    const TokenId y = tgt.lookup("y");
    assert(x < y);

    {
        AlignmentAggregator agg(src, tgt);
        assert(agg.add_sentence("a b", "x y", "0-0 0-1 1-1", err));
        const auto &freq = agg.frequencies();
        assert(freq.size() == 2);
        assert(freq.at(a).at(x) == 1);
        assert(freq.at(a).at(y) == 1);
        assert(freq.at(b).size() == 1);
        assert(freq.at(b).at(y) == 1);

        auto best = agg.best_alignment();
        assert(best.size() == 2);
        assert(best[0].first == a && best[0].second == x);
        assert(best[1].first == b && best[1].second == y);

        // A clear majority beats the lower index.
        assert(agg.add_sentence("a", "y", "0-0", err));
        best = agg.best_alignment();
        assert(best[0].second == y);

        assert(agg.write(tmp.file("out.txt"), err));
        assert(parabin_test::read_file(tmp.file("out.txt")) == "a y\nb y\n");
        assert(agg.sentences() == 2);
        assert(agg.counted_pairs() == 4);
    }

    // Unknown words are skipped; positions past the last word are errors.
    {
        AlignmentAggregator agg(src, tgt);
        assert(agg.add_sentence("a zzz", "x", "1-0 0-0", err));
        assert(agg.skipped_unknown() == 1);
        assert(agg.counted_pairs() == 1);

        err.clear();
        assert(!agg.add_sentence("a", "x", "5-0", err));
        assert(err.find("out of range") != std::string::npos);

        // Position == word count points at end-of-sequence.
        err.clear();
        assert(!agg.add_sentence("a", "x", "1-0", err));
        assert(err.find("end-of-sequence") != std::string::npos);

        // A literal <pad> word resolves to the pad index.
        err.clear();
        assert(!agg.add_sentence("<pad> a", "x x", "0-0", err));
        assert(err.find("pad") != std::string::npos);
        err.clear();
        assert(!agg.add_sentence("a", "<pad>", "0-0", err));
        assert(err.find("pad") != std::string::npos);
    }

    // Lockstep file aggregation.
    parabin_test::write_file(tmp.file("train.src"), "a b\nb\n");
    parabin_test::write_file(tmp.file("train.tgt"), "x y\ny\n");
    parabin_test::write_file(tmp.file("train.align"), "0-0 1-1\n0-0\n");
    {
        AlignmentAggregator agg(src, tgt);
        assert(agg.aggregate(tmp.file("train.src"), tmp.file("train.tgt"), tmp.file("train.align"), err));
        assert(agg.sentences() == 2);
        assert(agg.frequencies().at(b).at(y) == 2);
    }
    {
        parabin_test::write_file(tmp.file("short.align"), "0-0 1-1\n");
        AlignmentAggregator agg(src, tgt);
        err.clear();
        assert(!agg.aggregate(tmp.file("train.src"), tmp.file("train.tgt"), tmp.file("short.align"), err));
        assert(err.find("mismatch") != std::string::npos);
        assert(err.find("has 2 lines") != std::string::npos);
        assert(err.find("has 1 lines") != std::string::npos);
    }
    {
        parabin_test::write_file(tmp.file("bad.align"), "0-0\n0_0\n");
        AlignmentAggregator agg(src, tgt);
        err.clear();
        assert(!agg.aggregate(tmp.file("train.src"), tmp.file("train.tgt"), tmp.file("bad.align"), err));
        assert(err.find("line 2") != std::string::npos);
    }

    return 0;
}
