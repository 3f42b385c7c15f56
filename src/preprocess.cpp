#include "parabin/preprocess.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "parabin/alignment.hpp"
#include "parabin/dictionary.hpp"
#include "parabin/indexed_dataset.hpp"
#include "parabin/progress.hpp"

namespace parabin
{

namespace
{
std::string join_path(const std::string &dir, const std::string &name)
{
    return (std::filesystem::path(dir) / name).string();
}

std::string file_name(const std::string &path)
{
    return std::filesystem::path(path).filename().string();
}

std::string format_percent(double v)
{
    std::ostringstream os;
    os << std::setprecision(3) << v;
    return os.str();
}

bool prepare_dictionary(const Config &cfg, const std::string &lang, const std::string &given_path,
                        std::uint64_t threshold, std::int64_t nwords, const TokenizeFn &tokenize, std::string &err)
{
    Dictionary dict;
    if (!given_path.empty())
    {
        if (!Dictionary::load(given_path, dict, err))
        {
            return false;
        }
        std::cerr << "| [" << lang << "] Loaded dictionary: " << given_path << "\n";
    }
    else
    {
        std::string train_file = cfg.train_pref + "." + lang;
        if (!Dictionary::build(train_file, tokenize, dict, err))
        {
            return false;
        }
        std::cerr << "| [" << lang << "] Built dictionary from " << train_file << "\n";
    }
    return dict.save(dictionary_path(cfg, lang), threshold, nwords, err);
}

bool make_binary_dataset(const Config &cfg, const std::string &input, const std::string &split,
                         const std::string &lang, const TokenizeFn &tokenize, DatasetReport &report,
                         ProgressTracker &progress, std::string &err)
{
    Dictionary dict;
    if (!Dictionary::load(dictionary_path(cfg, lang), dict, err))
    {
        return false;
    }
    report.dict_size = dict.size();
    std::cerr << "| [" << lang << "] Dictionary: " << dict.size() - 1 << " types\n";

    const std::string prefix = dataset_prefix(cfg, split, lang);
    IndexedDatasetBuilder builder(cfg.dtype);
    if (!builder.open(dataset_data_path(prefix), err))
    {
        return false;
    }
    SequenceConsumer consumer = [&builder](const std::vector<TokenId> &ids, std::string &consumer_err)
    { return builder.add_item(ids, consumer_err); };
    if (!binarize(input, dict, consumer, false, tokenize, report.stats, err, &progress))
    {
        return false;
    }
    if (!builder.finalize(dataset_index_path(prefix), err))
    {
        return false;
    }
    report.output_path = prefix;
    std::cerr << "| [" << lang << "] " << input << ": " << report.stats.sentences << " sents, "
              << report.stats.tokens << " tokens, " << format_percent(report.stats.unknown_percent())
              << "% replaced by " << dict.unk_word() << "\n";
    return true;
}

bool make_raw_dataset(const Config &cfg, const std::string &input, const std::string &split,
                      const std::string &lang, DatasetReport &report, std::string &err)
{
    const std::string out = join_path(cfg.dest_dir, split + "." + lang);
    std::error_code ec;
    std::filesystem::copy_file(input, out, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
    {
        err = "failed to copy " + input + " to " + out + ": " + ec.message();
        return false;
    }
    report.output_path = out;
    std::cerr << "| [" << lang << "] Copied " << input << " to " << out << "\n";
    return true;
}
} // namespace

std::vector<SplitPrefix> expand_split_prefixes(const std::string &list, const std::string &name)
{
    std::vector<SplitPrefix> out;
    std::size_t start = 0;
    while (start <= list.size())
    {
        std::size_t comma = list.find(',', start);
        if (comma == std::string::npos)
        {
            comma = list.size();
        }
        std::string item = list.substr(start, comma - start);
        if (!item.empty())
        {
            SplitPrefix sp;
            sp.input_prefix = item;
            sp.output_name = out.empty() ? name : name + std::to_string(out.size());
            out.push_back(std::move(sp));
        }
        start = comma + 1;
    }
    return out;
}

std::string dictionary_path(const Config &cfg, const std::string &lang)
{
    return join_path(cfg.dest_dir, "dict." + lang + ".txt");
}

std::string dataset_prefix(const Config &cfg, const std::string &split, const std::string &lang)
{
    return join_path(cfg.dest_dir, split + "." + cfg.source_lang + "-" + cfg.target_lang + "." + lang);
}

std::string alignment_output_path(const Config &cfg)
{
    return join_path(cfg.dest_dir, "alignment." + cfg.source_lang + "-" + cfg.target_lang + ".txt");
}

bool run_preprocess(const Config &cfg, const TokenizeFn &tokenize, PreprocessResult &result, std::string &err)
{
    result = PreprocessResult();
    if (cfg.source_lang.empty() || cfg.target_lang.empty())
    {
        err = "source and target languages are required";
        return false;
    }
    if (cfg.source_lang == cfg.target_lang)
    {
        err = "source and target languages must differ";
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.dest_dir, ec);
    if (ec)
    {
        err = "failed to create destination dir: " + cfg.dest_dir;
        return false;
    }

    if (!prepare_dictionary(cfg, cfg.source_lang, cfg.src_dict, cfg.threshold_src, cfg.nwords_src, tokenize, err) ||
        !prepare_dictionary(cfg, cfg.target_lang, cfg.tgt_dict, cfg.threshold_tgt, cfg.nwords_tgt, tokenize, err))
    {
        return false;
    }

    std::vector<SplitPrefix> splits;
    if (!cfg.train_pref.empty())
    {
        splits.push_back(SplitPrefix{cfg.train_pref, "train"});
    }
    for (const auto &sp : expand_split_prefixes(cfg.valid_pref, "valid"))
    {
        splits.push_back(sp);
    }
    for (const auto &sp : expand_split_prefixes(cfg.test_pref, "test"))
    {
        splits.push_back(sp);
    }

    ProgressTracker progress(splits.size() * 2, "preprocess", cfg.progress_interval_ms);
    for (const auto &sp : splits)
    {
        for (const std::string &lang : {cfg.source_lang, cfg.target_lang})
        {
            DatasetReport report;
            report.split = sp.output_name;
            report.lang = lang;
            report.input_path = sp.input_prefix + "." + lang;
            report.format = cfg.output_format;
            bool ok = cfg.output_format == OutputFormat::binary
                          ? make_binary_dataset(cfg, report.input_path, sp.output_name, lang, tokenize, report,
                                                progress, err)
                          : make_raw_dataset(cfg, report.input_path, sp.output_name, lang, report, err);
            if (!ok)
            {
                return false;
            }
            progress.add(1, 0);
            result.datasets.push_back(std::move(report));
        }
    }
    progress.finish();

    Dictionary src_dict;
    Dictionary tgt_dict;
    if (!Dictionary::load(dictionary_path(cfg, cfg.source_lang), src_dict, err) ||
        !Dictionary::load(dictionary_path(cfg, cfg.target_lang), tgt_dict, err))
    {
        return false;
    }
    result.src_dict_size = src_dict.size();
    result.tgt_dict_size = tgt_dict.size();

    if (!cfg.align_file.empty())
    {
        AlignmentAggregator aggregator(src_dict, tgt_dict, tokenize);
        ProgressTracker align_progress(1, "alignment", cfg.progress_interval_ms);
        if (!aggregator.aggregate(cfg.train_pref + "." + cfg.source_lang, cfg.train_pref + "." + cfg.target_lang,
                                  cfg.align_file, err, &align_progress))
        {
            return false;
        }
        align_progress.add(1, 0);
        align_progress.finish();
        result.alignment_path = alignment_output_path(cfg);
        if (!aggregator.write(result.alignment_path, err))
        {
            return false;
        }
        result.has_alignment = true;
        result.alignment_entries = aggregator.frequencies().size();
        result.alignment_sentences = aggregator.sentences();
        std::cerr << "| Alignment: " << result.alignment_entries << " source types, " << aggregator.counted_pairs()
                  << " counted pairs, " << aggregator.skipped_unknown() << " skipped (unknown)\n";
    }

    if (!write_meta_json(join_path(cfg.dest_dir, "meta.json"), cfg, result, err))
    {
        return false;
    }
    std::cerr << "| Wrote preprocessed data to " << cfg.dest_dir << "\n";
    return true;
}

bool write_meta_json(const std::string &path, const Config &cfg, const PreprocessResult &result, std::string &err)
{
    nlohmann::json j;
    j["source_lang"] = cfg.source_lang;
    j["target_lang"] = cfg.target_lang;
    j["output_format"] = output_format_to_string(cfg.output_format);
    j["dtype"] = data_type_to_string(cfg.dtype);
    j["dictionaries"] = {
        {cfg.source_lang, {{"file", file_name(dictionary_path(cfg, cfg.source_lang))}, {"size", result.src_dict_size}}},
        {cfg.target_lang, {{"file", file_name(dictionary_path(cfg, cfg.target_lang))}, {"size", result.tgt_dict_size}}},
    };

    nlohmann::json datasets = nlohmann::json::array();
    for (const auto &d : result.datasets)
    {
        nlohmann::json entry;
        entry["split"] = d.split;
        entry["lang"] = d.lang;
        entry["input"] = d.input_path;
        if (d.format == OutputFormat::binary)
        {
            entry["data"] = file_name(dataset_data_path(d.output_path));
            entry["index"] = file_name(dataset_index_path(d.output_path));
            entry["sentences"] = d.stats.sentences;
            entry["tokens"] = d.stats.tokens;
            entry["unknown"] = d.stats.unknown;
            entry["replaced_types"] = d.stats.replaced_types;
            entry["unknown_percent"] = d.stats.unknown_percent();
        }
        else
        {
            entry["file"] = file_name(d.output_path);
        }
        datasets.push_back(std::move(entry));
    }
    j["datasets"] = std::move(datasets);

    if (result.has_alignment)
    {
        j["alignment"] = {
            {"file", file_name(result.alignment_path)},
            {"entries", result.alignment_entries},
            {"sentences", result.alignment_sentences},
        };
    }
    else
    {
        j["alignment"] = nullptr;
    }

    std::string text;
    try
    {
        text = j.dump(2);
    }
    catch (const nlohmann::json::exception &e)
    {
        err = std::string("failed to serialize meta.json: ") + e.what();
        return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        err = "failed to open " + path;
        return false;
    }
    out << text << "\n";
    out.flush();
    if (!out)
    {
        err = "failed to write " + path;
        return false;
    }
    return true;
}

int run_preprocess_main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);

    Config cfg;
    cfg.env_path = detect_env_path_arg(argc, argv, cfg.env_path);
    auto env = read_env_file(cfg.env_path);
    apply_env_overrides(cfg, env);

    std::string parse_err;
    bool show_help = false;
    if (!parse_preprocess_args(argc, argv, cfg, parse_err, show_help))
    {
        if (show_help)
        {
            print_preprocess_usage();
            return 0;
        }
        std::cerr << parse_err << "\n";
        print_preprocess_usage();
        return 1;
    }

    std::cerr << "Source: " << cfg.source_lang << "\n";
    std::cerr << "Target: " << cfg.target_lang << "\n";
    std::cerr << "Output format: " << output_format_to_string(cfg.output_format) << "\n";
    if (cfg.output_format == OutputFormat::binary)
    {
        std::cerr << "Dtype: " << data_type_to_string(cfg.dtype) << "\n";
    }
    std::cerr << "Dest dir: " << cfg.dest_dir << "\n";

    PreprocessResult result;
    std::string err;
    if (!run_preprocess(cfg, default_tokenizer(), result, err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    return 0;
}

} // namespace parabin
