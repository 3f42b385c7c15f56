#include "parabin/dump.hpp"

#include <exception>
#include <iostream>
#include <vector>

#include "parabin/dictionary.hpp"
#include "parabin/indexed_dataset.hpp"

namespace parabin
{

namespace
{
bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        unsigned long long v = std::stoull(s, &pos, 10);
        if (pos != s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}
} // namespace

void print_dump_usage()
{
    std::cerr << "Usage: ParaBinDump <prefix> [options]\n"
              << "Options:\n"
              << "  --dict <path>      Print symbols from this dictionary instead of indices\n"
              << "  --start <i>        First item to print (default: 0)\n"
              << "  --count <n>        Number of items to print (default: all)\n"
              << "  --header-only      Print only dtype, items and elements\n"
              << "  --help             Show this help\n";
}

bool parse_dump_args(int argc, char **argv, DumpArgs &args, std::string &err, bool &show_help)
{
    show_help = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next_value = [&](std::string &out) -> bool {
            if (i + 1 >= argc)
            {
                err = "missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };
        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--dict")
        {
            if (!next_value(args.dict_path))
            {
                return false;
            }
            continue;
        }
        if (arg == "--start" || arg == "--count")
        {
            std::string v;
            if (!next_value(v))
            {
                return false;
            }
            if (!parse_u64(v, arg == "--start" ? args.start : args.count))
            {
                err = "invalid " + arg + ": " + v;
                return false;
            }
            continue;
        }
        if (arg == "--header-only")
        {
            args.header_only = true;
            continue;
        }
        if (!arg.empty() && arg[0] == '-')
        {
            err = "unknown argument: " + arg;
            return false;
        }
        if (!args.prefix.empty())
        {
            err = "unexpected argument: " + arg;
            return false;
        }
        args.prefix = arg;
    }
    if (args.prefix.empty())
    {
        err = "missing dataset prefix";
        return false;
    }
    return true;
}

bool dump_dataset(const DumpArgs &args, std::ostream &out, std::string &err)
{
    Dictionary dict;
    bool use_dict = !args.dict_path.empty();
    if (use_dict && !Dictionary::load(args.dict_path, dict, err))
    {
        return false;
    }

    IndexedDatasetReader reader;
    if (!reader.open(dataset_index_path(args.prefix), dataset_data_path(args.prefix), err))
    {
        return false;
    }

    out << "dtype\t" << data_type_to_string(reader.dtype()) << "\n";
    out << "items\t" << reader.size() << "\n";
    out << "elements\t" << reader.num_elements() << "\n";
    if (args.header_only)
    {
        return true;
    }

    std::uint64_t end = reader.size();
    if (args.start < end && args.count > 0 && args.count < end - args.start)
    {
        end = args.start + args.count;
    }
    std::vector<std::int64_t> item;
    for (std::uint64_t i = args.start; i < end; ++i)
    {
        if (!reader.get(static_cast<std::size_t>(i), item, err))
        {
            return false;
        }
        out << i << "\t" << item.size() << "\t";
        for (std::size_t k = 0; k < item.size(); ++k)
        {
            if (k > 0)
            {
                out << ' ';
            }
            if (use_dict && item[k] >= 0 && static_cast<std::uint64_t>(item[k]) < dict.size())
            {
                out << dict.symbol(item[k]);
            }
            else
            {
                out << item[k];
            }
        }
        out << "\n";
    }
    if (!out)
    {
        err = "failed to write dump output";
        return false;
    }
    return true;
}

int run_dump_main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);

    DumpArgs args;
    std::string err;
    bool show_help = false;
    if (!parse_dump_args(argc, argv, args, err, show_help))
    {
        if (show_help)
        {
            print_dump_usage();
            return 0;
        }
        std::cerr << err << "\n";
        print_dump_usage();
        return 1;
    }
    if (!dump_dataset(args, std::cout, err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    return 0;
}

} // namespace parabin
