#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace parabin
{

enum class InputFormat
{
    text = 0,
    gz,
    xz
};

InputFormat detect_input_format(const std::string &path);

class LineSource;

// Pull-based line reader over plain, gzip and xz files. Lines are returned
// without the trailing "\n" or "\r\n"; a final line without a newline is
// still returned.
class LineReader
{
  public:
    LineReader();
    ~LineReader();

    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;

    bool open(const std::string &path, std::string &err);
    void close();

    // False at end of input or on a decode error; check error() to tell them apart.
    bool next(std::string &line);

    const std::string &error() const
    {
        return error_;
    }
    const std::string &path() const
    {
        return path_;
    }
    std::uint64_t line_number() const
    {
        return line_number_;
    }

  private:
    std::unique_ptr<LineSource> source_;
    std::string path_;
    std::string error_;
    std::uint64_t line_number_ = 0;
};

using LineCallback = std::function<bool(const std::string &line, std::uint64_t line_no, std::string &err)>;

// Calls cb for every line of path. Stops and returns false when the file cannot
// be read or cb returns false; err then holds the reason.
bool for_each_line(const std::string &path, const LineCallback &cb, std::string &err);

} // namespace parabin
