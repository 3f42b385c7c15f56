#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace parabin
{

// Tags are part of the on-disk index format and must not be renumbered.
enum class DataType : std::uint64_t
{
    uint8 = 1,
    int8 = 2,
    int16 = 3,
    int32 = 4,
    int64 = 5
};

std::size_t element_size(DataType dtype);
std::string data_type_to_string(DataType dtype);
bool parse_data_type(const std::string &text, DataType &dtype);
bool data_type_from_tag(std::uint64_t tag, DataType &dtype);
bool value_fits(DataType dtype, std::int64_t value);

constexpr char kIndexMagic[8] = {'T', 'N', 'T', 'I', 'D', 'X', '\0', '\0'};
constexpr std::uint64_t kIndexVersion = 1;

// Append-only writer for a sequence of integer items. Element bytes go to the
// data file as they are added; the offset table stays in memory until
// finalize() writes the index, which is the only commit point.
//
// Index layout (little-endian):
//   magic[8] version:u64 dtype:u64 element_size:u64 items:u64 sizes:u64
//   dim_offsets:i64[items+1] data_offsets:i64[items+1] sizes:i64[sizes]
class IndexedDatasetBuilder
{
  public:
    explicit IndexedDatasetBuilder(DataType dtype = DataType::int32);
    ~IndexedDatasetBuilder();

    IndexedDatasetBuilder(const IndexedDatasetBuilder &) = delete;
    IndexedDatasetBuilder &operator=(const IndexedDatasetBuilder &) = delete;

    bool open(const std::string &data_path, std::string &err);
    bool add_item(const std::vector<std::int64_t> &item, std::string &err);
    bool finalize(const std::string &index_path, std::string &err);

    std::size_t num_items() const
    {
        return sizes_.size();
    }
    std::uint64_t num_elements() const
    {
        return data_offsets_.back();
    }
    std::uint64_t num_bytes() const
    {
        return data_offsets_.back() * static_cast<std::uint64_t>(element_size_);
    }
    const std::vector<std::uint64_t> &data_offsets() const
    {
        return data_offsets_;
    }
    DataType dtype() const
    {
        return dtype_;
    }
    bool finalized() const
    {
        return finalized_;
    }

  private:
    bool write_elements(const std::vector<std::int64_t> &item, std::string &err);

    DataType dtype_;
    std::size_t element_size_;
    std::string data_path_;
    std::ofstream out_;
    std::vector<std::uint64_t> data_offsets_;
    std::vector<std::uint64_t> sizes_;
    std::vector<char> scratch_;
    bool finalized_ = false;
};

// Random-access reader over the files written by IndexedDatasetBuilder. The
// index is held in memory; item payloads are read from the data file on demand.
class IndexedDatasetReader
{
  public:
    bool open(const std::string &index_path, const std::string &data_path, std::string &err);

    std::size_t size() const
    {
        return sizes_.size();
    }
    std::uint64_t num_elements() const
    {
        return data_offsets_.empty() ? 0 : data_offsets_.back();
    }
    std::uint64_t item_size(std::size_t i) const
    {
        return sizes_[i];
    }
    DataType dtype() const
    {
        return dtype_;
    }
    const std::vector<std::uint64_t> &data_offsets() const
    {
        return data_offsets_;
    }

    bool get(std::size_t i, std::vector<std::int64_t> &out, std::string &err);

  private:
    bool read_index(const std::string &index_path, std::string &err);

    DataType dtype_ = DataType::int32;
    std::size_t element_size_ = 4;
    std::string data_path_;
    std::ifstream data_;
    std::vector<std::uint64_t> data_offsets_;
    std::vector<std::uint64_t> sizes_;
    std::vector<char> scratch_;
};

inline std::string dataset_data_path(const std::string &prefix)
{
    return prefix + ".bin";
}

inline std::string dataset_index_path(const std::string &prefix)
{
    return prefix + ".idx";
}

} // namespace parabin
