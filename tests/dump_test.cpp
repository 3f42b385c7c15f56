#include <cassert>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "parabin/dictionary.hpp"
#include "parabin/dump.hpp"
#include "parabin/indexed_dataset.hpp"
#include "test_util.hpp"

namespace
{
std::string dump(const parabin::DumpArgs &args)
{
    std::ostringstream out;
    std::string err;
    bool ok = parabin::dump_dataset(args, out, err);
    assert(ok);
    return out.str();
}

const std::string kHeader = "dtype\tint32\nitems\t3\nelements\t7\n";
} // namespace

int main()
{
    using namespace parabin;
    parabin_test::TempDir tmp("dump");
    std::string err;

    // Dictionary: hello=4 world=5.
    parabin_test::write_file(tmp.file("dict.txt"), "hello 2\nworld 1\n");
    const std::string prefix = tmp.file("train.de-en.de");
    {
        IndexedDatasetBuilder builder(DataType::int32);
        assert(builder.open(dataset_data_path(prefix), err));
        assert(builder.add_item({4, 5, 2}, err));
        assert(builder.add_item({2}, err));
        assert(builder.add_item({4, 3, 2}, err));
        assert(builder.finalize(dataset_index_path(prefix), err));
    }

    DumpArgs args;
    args.prefix = prefix;
    assert(dump(args) == kHeader + "0\t3\t4 5 2\n1\t1\t2\n2\t3\t4 3 2\n");

    args.header_only = true;
    assert(dump(args) == kHeader);
    args.header_only = false;

    args.dict_path = tmp.file("dict.txt");
    args.start = 2;
    assert(dump(args) == kHeader + "2\t3\thello <unk> </s>\n");
    args.dict_path.clear();

    args.start = 1;
    args.count = 1;
    assert(dump(args) == kHeader + "1\t1\t2\n");

    // Counts past the end are clamped, including ones that would wrap start + count.
    args.count = 5;
    assert(dump(args) == kHeader + "1\t1\t2\n2\t3\t4 3 2\n");
    args.count = std::numeric_limits<std::uint64_t>::max();
    assert(dump(args) == kHeader + "1\t1\t2\n2\t3\t4 3 2\n");

    args.start = 3;
    args.count = 0;
    assert(dump(args) == kHeader);
    args.start = std::numeric_limits<std::uint64_t>::max();
    assert(dump(args) == kHeader);

    {
        DumpArgs missing;
        missing.prefix = tmp.file("nope");
        std::ostringstream out;
        err.clear();
        assert(!dump_dataset(missing, out, err));
        assert(!err.empty());
        assert(out.str().empty());
    }
    {
        DumpArgs bad_dict;
        bad_dict.prefix = prefix;
        bad_dict.dict_path = tmp.file("missing_dict.txt");
        std::ostringstream out;
        err.clear();
        assert(!dump_dataset(bad_dict, out, err));
        assert(!err.empty());
    }

    // Argument parsing.
    {
        std::vector<std::string> values = {"ParaBinDump", prefix, "--start", "1", "--count",
                                           "18446744073709551615", "--dict", "d.txt", "--header-only"};
        std::vector<char *> argv;
        for (auto &v : values)
        {
            argv.push_back(&v[0]);
        }
        DumpArgs parsed;
        bool show_help = false;
        assert(parse_dump_args(static_cast<int>(argv.size()), argv.data(), parsed, err, show_help));
        assert(parsed.prefix == prefix);
        assert(parsed.start == 1);
        assert(parsed.count == std::numeric_limits<std::uint64_t>::max());
        assert(parsed.dict_path == "d.txt");
        assert(parsed.header_only);
    }
    for (const auto &bad : std::vector<std::vector<std::string>>{{"ParaBinDump"},
                                                                  {"ParaBinDump", "p", "--start", "-1"},
                                                                  {"ParaBinDump", "p", "--count"},
                                                                  {"ParaBinDump", "p", "q"},
                                                                  {"ParaBinDump", "p", "--bogus"}})
    {
        std::vector<std::string> values = bad;
        std::vector<char *> argv;
        for (auto &v : values)
        {
            argv.push_back(&v[0]);
        }
        DumpArgs parsed;
        bool show_help = false;
        err.clear();
        assert(!parse_dump_args(static_cast<int>(argv.size()), argv.data(), parsed, err, show_help));
        assert(!show_help);
        assert(!err.empty());
    }
    {
        std::string name = "ParaBinDump";
        std::string help = "--help";
        char *argv[] = {&name[0], &help[0]};
        DumpArgs parsed;
        bool show_help = false;
        assert(!parse_dump_args(2, argv, parsed, err, show_help));
        assert(show_help);
    }

    return 0;
}
