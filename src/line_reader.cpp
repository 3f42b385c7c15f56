#include "parabin/line_reader.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <vector>

#include <lzma.h>
#include <zlib.h>

namespace parabin
{

class LineSource
{
  public:
    virtual ~LineSource() = default;
    virtual bool read_line(std::string &line, std::string &err) = 0;
};

namespace
{
bool ends_with_ci(const std::string &s, const std::string &suffix)
{
    if (s.size() < suffix.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < suffix.size(); ++i)
    {
        char a = static_cast<char>(std::tolower(static_cast<unsigned char>(s[s.size() - suffix.size() + i])));
        if (a != suffix[i])
        {
            return false;
        }
    }
    return true;
}

void strip_eol(std::string &line)
{
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    {
        line.pop_back();
    }
}

class TextSource final : public LineSource
{
  public:
    explicit TextSource(const std::string &path) : in_(path, std::ios::binary)
    {
    }

    bool is_open() const
    {
        return static_cast<bool>(in_);
    }

    bool read_line(std::string &line, std::string &err) override
    {
        if (!std::getline(in_, line))
        {
            if (in_.bad())
            {
                err = "read error";
            }
            return false;
        }
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        return true;
    }

  private:
    std::ifstream in_;
};

class GzSource final : public LineSource
{
  public:
    explicit GzSource(const std::string &path) : gz_(gzopen(path.c_str(), "rb")), buf_(1 << 16, '\0')
    {
    }

    ~GzSource() override
    {
        if (gz_)
        {
            gzclose(gz_);
        }
    }

    bool is_open() const
    {
        return gz_ != nullptr;
    }

    bool read_line(std::string &line, std::string &err) override
    {
        line.clear();
        bool got_any = false;
        while (true)
        {
            char *res = gzgets(gz_, &buf_[0], static_cast<int>(buf_.size()));
            if (!res)
            {
                int errnum = Z_OK;
                const char *msg = gzerror(gz_, &errnum);
                if (errnum != Z_OK && errnum != Z_STREAM_END)
                {
                    err = std::string("gzip decode error: ") + (msg ? msg : "unknown");
                    return false;
                }
                break;
            }
            got_any = true;
            line.append(res);
            if (!line.empty() && line.back() == '\n')
            {
                break;
            }
        }
        if (!got_any)
        {
            return false;
        }
        strip_eol(line);
        return true;
    }

  private:
    gzFile gz_;
    std::string buf_;
};

class XzSource final : public LineSource
{
  public:
    explicit XzSource(const std::string &path) : in_(path, std::ios::binary), in_buf_(1 << 16), out_buf_(1 << 16)
    {
        if (in_ && lzma_stream_decoder(&strm_, UINT64_MAX, 0) == LZMA_OK)
        {
            ready_ = true;
        }
    }

    ~XzSource() override
    {
        lzma_end(&strm_);
    }

    bool is_open() const
    {
        return ready_;
    }

    bool read_line(std::string &line, std::string &err) override
    {
        while (true)
        {
            std::size_t nl = pending_.find('\n', scan_from_);
            if (nl != std::string::npos)
            {
                line.assign(pending_, 0, nl);
                pending_.erase(0, nl + 1);
                scan_from_ = 0;
                strip_eol(line);
                return true;
            }
            scan_from_ = pending_.size();
            if (finished_)
            {
                if (pending_.empty())
                {
                    return false;
                }
                line.swap(pending_);
                pending_.clear();
                scan_from_ = 0;
                strip_eol(line);
                return true;
            }
            if (!decode_more(err))
            {
                return false;
            }
        }
    }

  private:
    bool decode_more(std::string &err)
    {
        if (strm_.avail_in == 0 && !eof_)
        {
            in_.read(reinterpret_cast<char *>(in_buf_.data()), static_cast<std::streamsize>(in_buf_.size()));
            std::streamsize got = in_.gcount();
            strm_.next_in = in_buf_.data();
            strm_.avail_in = static_cast<std::size_t>(got);
            if (got == 0)
            {
                eof_ = true;
                action_ = LZMA_FINISH;
            }
        }

        strm_.next_out = out_buf_.data();
        strm_.avail_out = out_buf_.size();
        lzma_ret ret = lzma_code(&strm_, action_);
        std::size_t produced = out_buf_.size() - strm_.avail_out;
        if (produced > 0)
        {
            pending_.append(reinterpret_cast<const char *>(out_buf_.data()), produced);
        }
        if (ret == LZMA_STREAM_END)
        {
            finished_ = true;
            return true;
        }
        if (ret != LZMA_OK)
        {
            err = "xz decode error (lzma_ret=" + std::to_string(static_cast<int>(ret)) + ")";
            return false;
        }
        if (eof_ && strm_.avail_in == 0 && produced == 0)
        {
            err = "truncated xz stream";
            return false;
        }
        return true;
    }

    std::ifstream in_;
    lzma_stream strm_ = LZMA_STREAM_INIT;
    lzma_action action_ = LZMA_RUN;
    std::vector<std::uint8_t> in_buf_;
    std::vector<std::uint8_t> out_buf_;
    std::string pending_;
    std::size_t scan_from_ = 0;
    bool ready_ = false;
    bool eof_ = false;
    bool finished_ = false;
};
} // namespace

InputFormat detect_input_format(const std::string &path)
{
    if (ends_with_ci(path, ".gz"))
    {
        return InputFormat::gz;
    }
    if (ends_with_ci(path, ".xz"))
    {
        return InputFormat::xz;
    }
    return InputFormat::text;
}

LineReader::LineReader() = default;

LineReader::~LineReader() = default;

bool LineReader::open(const std::string &path, std::string &err)
{
    close();
    path_ = path;
    switch (detect_input_format(path))
    {
    case InputFormat::gz: {
        auto src = std::make_unique<GzSource>(path);
        if (!src->is_open())
        {
            err = "failed to open gzip input: " + path;
            return false;
        }
        source_ = std::move(src);
        break;
    }
    case InputFormat::xz: {
        auto src = std::make_unique<XzSource>(path);
        if (!src->is_open())
        {
            err = "failed to open xz input: " + path;
            return false;
        }
        source_ = std::move(src);
        break;
    }
    case InputFormat::text: {
        auto src = std::make_unique<TextSource>(path);
        if (!src->is_open())
        {
            err = "failed to open input: " + path;
            return false;
        }
        source_ = std::move(src);
        break;
    }
    }
    return true;
}

void LineReader::close()
{
    source_.reset();
    error_.clear();
    line_number_ = 0;
}

bool LineReader::next(std::string &line)
{
    if (!source_ || !error_.empty())
    {
        return false;
    }
    std::string err;
    if (!source_->read_line(line, err))
    {
        if (!err.empty())
        {
            error_ = err + ": " + path_ + " (after line " + std::to_string(line_number_) + ")";
        }
        return false;
    }
    ++line_number_;
    return true;
}

bool for_each_line(const std::string &path, const LineCallback &cb, std::string &err)
{
    LineReader reader;
    if (!reader.open(path, err))
    {
        return false;
    }
    std::string line;
    while (reader.next(line))
    {
        if (!cb(line, reader.line_number(), err))
        {
            return false;
        }
    }
    if (!reader.error().empty())
    {
        err = reader.error();
        return false;
    }
    return true;
}

} // namespace parabin
