#include "parabin/config.hpp"

#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>

namespace parabin
{

namespace
{
std::string trim(const std::string &s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_ascii(std::string s)
{
    for (char &c : s)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        std::uint64_t v = static_cast<std::uint64_t>(std::stoull(s, &pos, 10));
        if (pos != s.size())
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_i64(const std::string &s, std::int64_t &out)
{
    try
    {
        std::size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size())
        {
            return false;
        }
        out = static_cast<std::int64_t>(v);
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_size_value(const std::string &s, std::size_t &out)
{
    std::uint64_t v = 0;
    if (!parse_u64(s, v))
    {
        return false;
    }
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()))
    {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

// Word limits accept any negative value as "keep all".
bool parse_nwords(const std::string &s, std::int64_t &out)
{
    std::int64_t v = 0;
    if (!parse_i64(s, v))
    {
        return false;
    }
    out = v < 0 ? -1 : v;
    return true;
}
} // namespace

std::string output_format_to_string(OutputFormat format)
{
    switch (format)
    {
    case OutputFormat::binary:
        return "binary";
    case OutputFormat::raw:
        return "raw";
    }
    return "binary";
}

bool parse_output_format(const std::string &text, OutputFormat &format)
{
    std::string v = to_lower_ascii(text);
    if (v == "binary")
    {
        format = OutputFormat::binary;
        return true;
    }
    if (v == "raw")
    {
        format = OutputFormat::raw;
        return true;
    }
    return false;
}

std::unordered_map<std::string, std::string> read_env_file(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in)
    {
        return env;
    }
    bool first_line = true;
    std::string line;
    while (std::getline(in, line))
    {
        if (first_line)
        {
            first_line = false;
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
            {
                line.erase(0, 3);
            }
        }
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string val = trim(trimmed.substr(eq + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\'')))
        {
            val = val.substr(1, val.size() - 2);
        }
        env[key] = val;
    }
    return env;
}

void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("SOURCE_LANG"))
        cfg.source_lang = *v;
    if (auto v = get("TARGET_LANG"))
        cfg.target_lang = *v;
    if (auto v = get("TRAIN_PREF"))
        cfg.train_pref = *v;
    if (auto v = get("VALID_PREF"))
        cfg.valid_pref = *v;
    if (auto v = get("TEST_PREF"))
        cfg.test_pref = *v;
    if (auto v = get("DEST_DIR"))
        cfg.dest_dir = *v;
    auto warn_invalid = [](const char *key, const std::string &value) {
        std::cerr << "ignoring invalid " << key << " from env file: " << value << "\n";
    };
    if (auto v = get("THRESHOLD_SRC"))
    {
        if (!parse_u64(*v, cfg.threshold_src))
            warn_invalid("THRESHOLD_SRC", *v);
    }
    if (auto v = get("THRESHOLD_TGT"))
    {
        if (!parse_u64(*v, cfg.threshold_tgt))
            warn_invalid("THRESHOLD_TGT", *v);
    }
    if (auto v = get("NWORDS_SRC"))
    {
        if (!parse_nwords(*v, cfg.nwords_src))
            warn_invalid("NWORDS_SRC", *v);
    }
    if (auto v = get("NWORDS_TGT"))
    {
        if (!parse_nwords(*v, cfg.nwords_tgt))
            warn_invalid("NWORDS_TGT", *v);
    }
    if (auto v = get("SRC_DICT"))
        cfg.src_dict = *v;
    if (auto v = get("TGT_DICT"))
        cfg.tgt_dict = *v;
    if (auto v = get("ALIGN_FILE"))
        cfg.align_file = *v;
    if (auto v = get("OUTPUT_FORMAT"))
    {
        if (!parse_output_format(*v, cfg.output_format))
            warn_invalid("OUTPUT_FORMAT", *v);
    }
    if (auto v = get("DTYPE"))
    {
        if (!parse_data_type(*v, cfg.dtype))
            warn_invalid("DTYPE", *v);
    }
    if (auto v = get("PROGRESS_INTERVAL_MS"))
    {
        if (!parse_size_value(*v, cfg.progress_interval_ms))
            warn_invalid("PROGRESS_INTERVAL_MS", *v);
    }
}

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path)
{
    std::string path = default_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--env-file" && i + 1 < argc)
        {
            path = argv[i + 1];
            ++i;
        }
    }
    return path;
}

void print_preprocess_usage()
{
    std::cerr << "ParaBinPreprocess: build dictionaries and store parallel data in binary format\n"
              << "Usage:\n"
              << "  ParaBinPreprocess -s <src> -t <tgt> [options]\n\n"
              << "Options:\n"
              << "  --env-file <path>            Path to .env (default: .env)\n"
              << "  -s, --source-lang <lang>     Source language\n"
              << "  -t, --target-lang <lang>     Target language\n"
              << "  --trainpref <prefix>         Train file prefix (default: train)\n"
              << "  --validpref <list>           Comma separated valid prefixes (default: valid)\n"
              << "  --testpref <list>            Comma separated test prefixes (default: test)\n"
              << "  --destdir <dir>              Destination dir (default: data-bin)\n"
              << "  --thresholdsrc <n>           Map source words seen fewer than n times to <unk> (default: 0)\n"
              << "  --thresholdtgt <n>           Map target words seen fewer than n times to <unk> (default: 0)\n"
              << "  --nwordssrc <n>              Number of source words to retain (default: -1=all)\n"
              << "  --nwordstgt <n>              Number of target words to retain (default: -1=all)\n"
              << "  --srcdict <path>             Reuse given source dictionary\n"
              << "  --tgtdict <path>             Reuse given target dictionary\n"
              << "  --alignfile <path>           Alignment file for the train split (optional)\n"
              << "  --output-format <fmt>        binary | raw (default: binary)\n"
              << "  --dtype <type>               uint8 | int8 | int16 | int32 | int64 (default: int32)\n"
              << "  --progress-interval-ms <n>   Progress update interval (default: 1000)\n"
              << "  --help                       Show this help\n";
}

bool parse_preprocess_args(int argc, char **argv, Config &cfg, std::string &err, bool &show_help)
{
    show_help = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto require_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };
        auto string_option = [&](std::string &target) -> bool {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            target = v;
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--env-file")
        {
            if (!string_option(cfg.env_path))
            {
                return false;
            }
            continue;
        }
        if (arg == "-s" || arg == "--source-lang")
        {
            if (!string_option(cfg.source_lang))
            {
                return false;
            }
            continue;
        }
        if (arg == "-t" || arg == "--target-lang")
        {
            if (!string_option(cfg.target_lang))
            {
                return false;
            }
            continue;
        }
        if (arg == "--trainpref")
        {
            if (!string_option(cfg.train_pref))
            {
                return false;
            }
            continue;
        }
        if (arg == "--validpref")
        {
            if (!string_option(cfg.valid_pref))
            {
                return false;
            }
            continue;
        }
        if (arg == "--testpref")
        {
            if (!string_option(cfg.test_pref))
            {
                return false;
            }
            continue;
        }
        if (arg == "--destdir")
        {
            if (!string_option(cfg.dest_dir))
            {
                return false;
            }
            continue;
        }
        if (arg == "--srcdict")
        {
            if (!string_option(cfg.src_dict))
            {
                return false;
            }
            continue;
        }
        if (arg == "--tgtdict")
        {
            if (!string_option(cfg.tgt_dict))
            {
                return false;
            }
            continue;
        }
        if (arg == "--alignfile")
        {
            if (!string_option(cfg.align_file))
            {
                return false;
            }
            continue;
        }
        if (arg == "--thresholdsrc" || arg == "--thresholdtgt")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            std::uint64_t &target = arg == "--thresholdsrc" ? cfg.threshold_src : cfg.threshold_tgt;
            if (!parse_u64(v, target))
            {
                err = "invalid " + arg + ": " + std::string(v);
                return false;
            }
            continue;
        }
        if (arg == "--nwordssrc" || arg == "--nwordstgt")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            std::int64_t &target = arg == "--nwordssrc" ? cfg.nwords_src : cfg.nwords_tgt;
            if (!parse_nwords(v, target))
            {
                err = "invalid " + arg + ": " + std::string(v);
                return false;
            }
            continue;
        }
        if (arg == "--output-format")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            if (!parse_output_format(v, cfg.output_format))
            {
                err = "invalid --output-format: " + std::string(v) + " (expected binary or raw)";
                return false;
            }
            continue;
        }
        if (arg == "--dtype")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            if (!parse_data_type(v, cfg.dtype))
            {
                err = "invalid --dtype: " + std::string(v);
                return false;
            }
            continue;
        }
        if (arg == "--progress-interval-ms")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            if (!parse_size_value(v, cfg.progress_interval_ms))
            {
                err = "invalid --progress-interval-ms: " + std::string(v);
                return false;
            }
            continue;
        }

        err = "unknown argument: " + arg;
        return false;
    }

    if (cfg.source_lang.empty() || cfg.target_lang.empty())
    {
        err = "source and target languages are required (-s/-t or SOURCE_LANG/TARGET_LANG)";
        return false;
    }
    if (cfg.source_lang == cfg.target_lang)
    {
        err = "source and target languages must differ: " + cfg.source_lang;
        return false;
    }
    return true;
}

} // namespace parabin
