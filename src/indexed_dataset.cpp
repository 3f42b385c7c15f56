#include "parabin/indexed_dataset.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <limits>

namespace parabin
{

namespace
{
void put_u64(std::vector<char> &buf, std::uint64_t v)
{
    for (int b = 0; b < 8; ++b)
    {
        buf.push_back(static_cast<char>((v >> (8 * b)) & 0xFFu));
    }
}

void put_element(std::vector<char> &buf, std::int64_t v, std::size_t width)
{
    std::uint64_t u = static_cast<std::uint64_t>(v);
    for (std::size_t b = 0; b < width; ++b)
    {
        buf.push_back(static_cast<char>((u >> (8 * b)) & 0xFFu));
    }
}

std::int64_t get_element(const char *p, DataType dtype, std::size_t width)
{
    std::uint64_t u = 0;
    for (std::size_t b = 0; b < width; ++b)
    {
        u |= static_cast<std::uint64_t>(static_cast<unsigned char>(p[b])) << (8 * b);
    }
    switch (dtype)
    {
    case DataType::uint8:
        return static_cast<std::int64_t>(u);
    case DataType::int8:
        return static_cast<std::int8_t>(static_cast<std::uint8_t>(u));
    case DataType::int16:
        return static_cast<std::int16_t>(static_cast<std::uint16_t>(u));
    case DataType::int32:
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(u));
    case DataType::int64:
        return static_cast<std::int64_t>(u);
    }
    return static_cast<std::int64_t>(u);
}
} // namespace

std::size_t element_size(DataType dtype)
{
    switch (dtype)
    {
    case DataType::uint8:
    case DataType::int8:
        return 1;
    case DataType::int16:
        return 2;
    case DataType::int32:
        return 4;
    case DataType::int64:
        return 8;
    }
    return 4;
}

std::string data_type_to_string(DataType dtype)
{
    switch (dtype)
    {
    case DataType::uint8:
        return "uint8";
    case DataType::int8:
        return "int8";
    case DataType::int16:
        return "int16";
    case DataType::int32:
        return "int32";
    case DataType::int64:
        return "int64";
    }
    return "int32";
}

bool parse_data_type(const std::string &text, DataType &dtype)
{
    std::string v;
    v.reserve(text.size());
    for (char c : text)
    {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "uint8" || v == "u8")
    {
        dtype = DataType::uint8;
        return true;
    }
    if (v == "int8" || v == "i8")
    {
        dtype = DataType::int8;
        return true;
    }
    if (v == "int16" || v == "i16")
    {
        dtype = DataType::int16;
        return true;
    }
    if (v == "int32" || v == "i32" || v == "int")
    {
        dtype = DataType::int32;
        return true;
    }
    if (v == "int64" || v == "i64" || v == "long")
    {
        dtype = DataType::int64;
        return true;
    }
    return false;
}

bool data_type_from_tag(std::uint64_t tag, DataType &dtype)
{
    if (tag < static_cast<std::uint64_t>(DataType::uint8) || tag > static_cast<std::uint64_t>(DataType::int64))
    {
        return false;
    }
    dtype = static_cast<DataType>(tag);
    return true;
}

bool value_fits(DataType dtype, std::int64_t value)
{
    switch (dtype)
    {
    case DataType::uint8:
        return value >= 0 && value <= std::numeric_limits<std::uint8_t>::max();
    case DataType::int8:
        return value >= std::numeric_limits<std::int8_t>::min() && value <= std::numeric_limits<std::int8_t>::max();
    case DataType::int16:
        return value >= std::numeric_limits<std::int16_t>::min() && value <= std::numeric_limits<std::int16_t>::max();
    case DataType::int32:
        return value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max();
    case DataType::int64:
        return true;
    }
    return false;
}

IndexedDatasetBuilder::IndexedDatasetBuilder(DataType dtype)
    : dtype_(dtype), element_size_(element_size(dtype)), data_offsets_{0}
{
}

IndexedDatasetBuilder::~IndexedDatasetBuilder()
{
    // An unfinalized builder leaves a data file but no index.
    if (out_.is_open())
    {
        out_.close();
    }
}

bool IndexedDatasetBuilder::open(const std::string &data_path, std::string &err)
{
    if (finalized_)
    {
        err = "dataset builder already finalized: " + data_path_;
        return false;
    }
    if (out_.is_open())
    {
        err = "dataset builder already open: " + data_path_;
        return false;
    }
    data_path_ = data_path;
    out_.open(data_path_, std::ios::binary | std::ios::trunc);
    if (!out_)
    {
        err = "failed to open dataset for write: " + data_path_;
        return false;
    }
    data_offsets_.assign(1, 0);
    sizes_.clear();
    return true;
}

bool IndexedDatasetBuilder::add_item(const std::vector<std::int64_t> &item, std::string &err)
{
    if (finalized_)
    {
        err = "add_item on finalized dataset: " + data_path_;
        return false;
    }
    if (!out_.is_open())
    {
        err = "add_item on dataset that was never opened";
        return false;
    }
    if (!write_elements(item, err))
    {
        return false;
    }
    data_offsets_.push_back(data_offsets_.back() + static_cast<std::uint64_t>(item.size()));
    sizes_.push_back(static_cast<std::uint64_t>(item.size()));
    return true;
}

bool IndexedDatasetBuilder::write_elements(const std::vector<std::int64_t> &item, std::string &err)
{
    if (item.empty())
    {
        return true;
    }
    scratch_.clear();
    scratch_.reserve(item.size() * element_size_);
    for (std::int64_t v : item)
    {
        if (!value_fits(dtype_, v))
        {
            err = "value " + std::to_string(v) + " overflows " + data_type_to_string(dtype_) + " dataset: " +
                  data_path_;
            return false;
        }
        put_element(scratch_, v, element_size_);
    }
    out_.write(scratch_.data(), static_cast<std::streamsize>(scratch_.size()));
    if (!out_)
    {
        err = "failed to write dataset: " + data_path_;
        return false;
    }
    return true;
}

bool IndexedDatasetBuilder::finalize(const std::string &index_path, std::string &err)
{
    if (finalized_)
    {
        err = "dataset already finalized: " + data_path_;
        return false;
    }
    if (!out_.is_open())
    {
        err = "finalize on dataset that was never opened";
        return false;
    }
    out_.flush();
    if (!out_)
    {
        err = "failed to flush dataset: " + data_path_;
        return false;
    }
    out_.close();

    const std::uint64_t items = static_cast<std::uint64_t>(sizes_.size());
    std::vector<char> payload;
    payload.reserve(48 + (items + 1) * 16 + items * 8);
    payload.insert(payload.end(), std::begin(kIndexMagic), std::end(kIndexMagic));
    put_u64(payload, kIndexVersion);
    put_u64(payload, static_cast<std::uint64_t>(dtype_));
    put_u64(payload, static_cast<std::uint64_t>(element_size_));
    put_u64(payload, items);
    put_u64(payload, static_cast<std::uint64_t>(sizes_.size()));
    // One dimension per item.
    for (std::uint64_t i = 0; i <= items; ++i)
    {
        put_u64(payload, i);
    }
    for (std::uint64_t off : data_offsets_)
    {
        put_u64(payload, off);
    }
    for (std::uint64_t sz : sizes_)
    {
        put_u64(payload, sz);
    }

    std::ofstream index(index_path, std::ios::binary | std::ios::trunc);
    if (!index)
    {
        err = "failed to open index for write: " + index_path;
        return false;
    }
    index.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    index.flush();
    if (!index)
    {
        err = "failed to write index: " + index_path;
        return false;
    }
    finalized_ = true;
    return true;
}

bool IndexedDatasetReader::read_index(const std::string &index_path, std::string &err)
{
    std::ifstream in(index_path, std::ios::binary);
    if (!in)
    {
        err = "failed to open index: " + index_path;
        return false;
    }
    std::vector<char> payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::size_t pos = 0;
    auto read_u64 = [&](std::uint64_t &x) -> bool {
        if (pos + 8 > payload.size())
        {
            return false;
        }
        x = 0;
        for (int b = 0; b < 8; ++b)
        {
            x |= static_cast<std::uint64_t>(static_cast<unsigned char>(payload[pos + b])) << (8 * b);
        }
        pos += 8;
        return true;
    };

    if (payload.size() < sizeof(kIndexMagic) || !std::equal(std::begin(kIndexMagic), std::end(kIndexMagic), payload.begin()))
    {
        err = "bad index magic: " + index_path;
        return false;
    }
    pos = sizeof(kIndexMagic);

    std::uint64_t version = 0;
    std::uint64_t tag = 0;
    std::uint64_t width = 0;
    std::uint64_t items = 0;
    std::uint64_t sizes_count = 0;
    if (!read_u64(version) || !read_u64(tag) || !read_u64(width) || !read_u64(items) || !read_u64(sizes_count))
    {
        err = "truncated index header: " + index_path;
        return false;
    }
    if (version != kIndexVersion)
    {
        err = "unsupported index version " + std::to_string(version) + ": " + index_path;
        return false;
    }
    if (!data_type_from_tag(tag, dtype_))
    {
        err = "unknown dtype tag " + std::to_string(tag) + ": " + index_path;
        return false;
    }
    element_size_ = element_size(dtype_);
    if (width != element_size_)
    {
        err = "element size " + std::to_string(width) + " does not match dtype " + data_type_to_string(dtype_) +
              ": " + index_path;
        return false;
    }
    if (sizes_count != items)
    {
        err = "expected one size per item (items=" + std::to_string(items) + ", sizes=" +
              std::to_string(sizes_count) + "): " + index_path;
        return false;
    }
    const std::uint64_t expected_bytes = pos + (items + 1) * 16 + sizes_count * 8;
    if (payload.size() != expected_bytes)
    {
        err = "index size mismatch (expected " + std::to_string(expected_bytes) + " bytes, got " +
              std::to_string(payload.size()) + "): " + index_path;
        return false;
    }

    for (std::uint64_t i = 0; i <= items; ++i)
    {
        std::uint64_t dim = 0;
        read_u64(dim);
        if (dim != i)
        {
            err = "unsupported multi-dimensional item " + std::to_string(i) + ": " + index_path;
            return false;
        }
    }
    data_offsets_.resize(static_cast<std::size_t>(items + 1));
    for (auto &off : data_offsets_)
    {
        read_u64(off);
    }
    sizes_.resize(static_cast<std::size_t>(sizes_count));
    for (auto &sz : sizes_)
    {
        read_u64(sz);
    }

    if (data_offsets_[0] != 0)
    {
        err = "first data offset is not zero: " + index_path;
        return false;
    }
    for (std::size_t i = 0; i < sizes_.size(); ++i)
    {
        if (data_offsets_[i + 1] < data_offsets_[i] || data_offsets_[i + 1] - data_offsets_[i] != sizes_[i])
        {
            err = "inconsistent offsets at item " + std::to_string(i) + ": " + index_path;
            return false;
        }
    }
    return true;
}

bool IndexedDatasetReader::open(const std::string &index_path, const std::string &data_path, std::string &err)
{
    if (!read_index(index_path, err))
    {
        return false;
    }
    std::error_code ec;
    std::uint64_t bytes = std::filesystem::file_size(data_path, ec);
    if (ec)
    {
        err = "failed to stat dataset: " + data_path;
        return false;
    }
    const std::uint64_t expected = num_elements() * static_cast<std::uint64_t>(element_size_);
    if (bytes != expected)
    {
        err = "dataset size mismatch (expected " + std::to_string(expected) + " bytes, got " +
              std::to_string(bytes) + "): " + data_path;
        return false;
    }
    data_path_ = data_path;
    data_.open(data_path_, std::ios::binary);
    if (!data_)
    {
        err = "failed to open dataset: " + data_path_;
        return false;
    }
    return true;
}

bool IndexedDatasetReader::get(std::size_t i, std::vector<std::int64_t> &out, std::string &err)
{
    if (i >= sizes_.size())
    {
        err = "item index " + std::to_string(i) + " out of range (size " + std::to_string(sizes_.size()) + ")";
        return false;
    }
    out.clear();
    const std::uint64_t n = sizes_[i];
    if (n == 0)
    {
        return true;
    }
    scratch_.resize(static_cast<std::size_t>(n) * element_size_);
    data_.clear();
    data_.seekg(static_cast<std::streamoff>(data_offsets_[i] * element_size_), std::ios::beg);
    data_.read(scratch_.data(), static_cast<std::streamsize>(scratch_.size()));
    if (!data_)
    {
        err = "failed to read item " + std::to_string(i) + ": " + data_path_;
        return false;
    }
    out.reserve(static_cast<std::size_t>(n));
    for (std::size_t k = 0; k < static_cast<std::size_t>(n); ++k)
    {
        out.push_back(get_element(scratch_.data() + k * element_size_, dtype_, element_size_));
    }
    return true;
}

} // namespace parabin
