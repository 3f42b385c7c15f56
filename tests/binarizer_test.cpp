#include <cassert>
#include <string>
#include <vector>

#include <zlib.h>

#include "parabin/binarizer.hpp"
#include "parabin/dictionary.hpp"
#include "parabin/indexed_dataset.hpp"
#include "test_util.hpp"

namespace
{
parabin::Dictionary make_dict()
{
    parabin::Dictionary d;
    d.add("the", 10);
    d.add("cat", 5);
    d.add("sat", 3);
    d.finalize(0, -1);
    return d;
}
} // namespace

int main()
{
    using namespace parabin;
    parabin_test::TempDir tmp("binarizer");

    // Tokenizer collapses whitespace.
    assert((split_whitespace_words("  a\t b\n") == std::vector<std::string>{"a", "b"}));
    assert(split_whitespace_words(" \t ").empty());

    Dictionary dict = make_dict();
    const TokenId the = dict.lookup("the");
    const TokenId cat = dict.lookup("cat");
    const TokenId sat = dict.lookup("sat");

    {
        auto ids = encode_line("the  cat", default_tokenizer(), static_cast<const Dictionary &>(dict));
        assert((ids == std::vector<TokenId>{the, cat, dict.eos()}));
        assert(encode_line("", default_tokenizer(), static_cast<const Dictionary &>(dict)) ==
               std::vector<TokenId>{dict.eos()});
    }

    // "dog" twice and "mat" once are unknown; the literal <unk> is not a replacement.
    parabin_test::write_file(tmp.file("corpus.txt"), "the cat sat\ndog dog mat\n\nthe <unk>\n");
    std::vector<std::vector<TokenId>> seen;
    SequenceConsumer collect = [&](const std::vector<TokenId> &ids, std::string &)
    {
        seen.push_back(ids);
        return true;
    };
    BinarizeStats stats;
    std::string err;
    bool ok = binarize(tmp.file("corpus.txt"), dict, collect, false, default_tokenizer(), stats, err);
    assert(ok);
    assert(stats.sentences == 4);
    assert(seen.size() == 4);
    assert((seen[0] == std::vector<TokenId>{the, cat, sat, dict.eos()}));
    assert((seen[1] == std::vector<TokenId>{dict.unk(), dict.unk(), dict.unk(), dict.eos()}));
    assert((seen[2] == std::vector<TokenId>{dict.eos()}));
    assert((seen[3] == std::vector<TokenId>{the, dict.unk(), dict.eos()}));
    assert(stats.tokens == 4 + 4 + 1 + 3);
    assert(stats.unknown == 3);
    assert(stats.replaced_types == 2);
    assert(stats.unknown_percent() > 24.99 && stats.unknown_percent() < 25.01);
    assert(dict.count(dict.unk()) == 3);
    assert(!dict.contains("dog"));

    // Extending the vocabulary adds unseen words instead of replacing them.
    {
        Dictionary grow = make_dict();
        BinarizeStats grow_stats;
        SequenceConsumer ignore = [](const std::vector<TokenId> &, std::string &) { return true; };
        ok = binarize(tmp.file("corpus.txt"), grow, ignore, true, default_tokenizer(), grow_stats, err);
        assert(ok);
        assert(grow.contains("dog"));
        assert(grow.count(grow.lookup("dog")) == 2);
        assert(grow_stats.unknown == 0);
    }

    // Consumer failures stop the run and name the line.
    {
        SequenceConsumer fail_second = [&](const std::vector<TokenId> &, std::string &consumer_err)
        {
            if (seen.size() >= 5)
            {
                consumer_err = "sink full";
                return false;
            }
            seen.emplace_back();
            return true;
        };
        BinarizeStats partial;
        err.clear();
        ok = binarize(tmp.file("corpus.txt"), dict, fail_second, false, default_tokenizer(), partial, err);
        assert(!ok);
        assert(err.find("sink full") != std::string::npos);
        assert(err.find("line 2") != std::string::npos);
    }

    // Gzip input through the dataset builder: N items of length L_i + 1.
    {
        gzFile f = gzopen(tmp.file("corpus.txt.gz").c_str(), "wb");
        assert(f != nullptr);
        const std::string text = "the cat\nsat\nthe the the cat\n";
        assert(gzwrite(f, text.data(), static_cast<unsigned>(text.size())) == static_cast<int>(text.size()));
        assert(gzclose(f) == Z_OK);

        IndexedDatasetBuilder builder(DataType::int32);
        assert(builder.open(tmp.file("out.bin"), err));
        SequenceConsumer to_builder = [&](const std::vector<TokenId> &ids, std::string &consumer_err)
        { return builder.add_item(ids, consumer_err); };
        BinarizeStats gz_stats;
        ok = binarize(tmp.file("corpus.txt.gz"), dict, to_builder, false, default_tokenizer(), gz_stats, err);
        assert(ok);
        assert(builder.finalize(tmp.file("out.idx"), err));

        IndexedDatasetReader reader;
        assert(reader.open(tmp.file("out.idx"), tmp.file("out.bin"), err));
        assert(reader.size() == 3);
        assert(reader.item_size(0) == 3);
        assert(reader.item_size(1) == 2);
        assert(reader.item_size(2) == 5);
        assert(reader.num_elements() == gz_stats.tokens);
        std::vector<std::int64_t> item;
        assert(reader.get(2, item, err));
        assert((item == std::vector<std::int64_t>{the, the, the, cat, dict.eos()}));
    }

    return 0;
}
