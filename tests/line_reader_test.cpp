#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include <lzma.h>
#include <zlib.h>

#include "parabin/line_reader.hpp"
#include "test_util.hpp"

namespace
{
std::vector<std::string> read_all(const std::string &path)
{
    parabin::LineReader reader;
    std::string err;
    bool opened = reader.open(path, err);
    assert(opened);
    assert(reader.path() == path);
    std::vector<std::string> lines;
    std::string line;
    while (reader.next(line))
    {
        lines.push_back(line);
    }
    assert(reader.error().empty());
    assert(reader.line_number() == lines.size());
    return lines;
}

void write_gz(const std::string &path, const std::string &content)
{
    gzFile f = gzopen(path.c_str(), "wb");
    assert(f != nullptr);
    int written = gzwrite(f, content.data(), static_cast<unsigned>(content.size()));
    assert(written == static_cast<int>(content.size()));
    assert(gzclose(f) == Z_OK);
}

void write_xz(const std::string &path, const std::string &content)
{
    std::vector<std::uint8_t> out(lzma_stream_buffer_bound(content.size()));
    std::size_t out_pos = 0;
    lzma_ret ret = lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                           reinterpret_cast<const std::uint8_t *>(content.data()), content.size(),
                                           out.data(), &out_pos, out.size());
    assert(ret == LZMA_OK);
    parabin_test::write_file(path, std::string(reinterpret_cast<const char *>(out.data()), out_pos));
}
} // namespace

int main()
{
    using namespace parabin;
    parabin_test::TempDir tmp("line_reader");

    assert(detect_input_format("a/train.de") == InputFormat::text);
    assert(detect_input_format("train.de.gz") == InputFormat::gz);
    assert(detect_input_format("train.de.XZ") == InputFormat::xz);

    // CRLF endings, an empty line and a last line without newline.
    parabin_test::write_file(tmp.file("plain.txt"), "hello world\r\n\r\nlast line");
    auto plain = read_all(tmp.file("plain.txt"));
    assert((plain == std::vector<std::string>{"hello world", "", "last line"}));

    parabin_test::write_file(tmp.file("empty.txt"), "");
    assert(read_all(tmp.file("empty.txt")).empty());

    parabin_test::write_file(tmp.file("trailing.txt"), "a\nb\n");
    assert((read_all(tmp.file("trailing.txt")) == std::vector<std::string>{"a", "b"}));

    // Long enough to cross decoder buffer boundaries.
    std::string big;
    for (int i = 0; i < 20000; ++i)
    {
        big += "line " + std::to_string(i) + "\n";
    }
    write_gz(tmp.file("big.txt.gz"), big);
    auto gz_lines = read_all(tmp.file("big.txt.gz"));
    assert(gz_lines.size() == 20000);
    assert(gz_lines.front() == "line 0");
    assert(gz_lines.back() == "line 19999");

    write_xz(tmp.file("big.txt.xz"), big + "tail");
    auto xz_lines = read_all(tmp.file("big.txt.xz"));
    assert(xz_lines.size() == 20001);
    assert(xz_lines[12345] == "line 12345");
    assert(xz_lines.back() == "tail");

    // Garbage behind a .xz suffix is a decode error, not end of input.
    parabin_test::write_file(tmp.file("bad.xz"), "this is not xz data at all");
    {
        LineReader reader;
        std::string err;
        bool opened = reader.open(tmp.file("bad.xz"), err);
        std::string line;
        if (opened)
        {
            while (reader.next(line))
            {
            }
            assert(!reader.error().empty());
        }
        else
        {
            assert(!err.empty());
        }
    }

    {
        LineReader reader;
        std::string err;
        assert(!reader.open(tmp.file("missing.txt"), err));
        assert(!err.empty());
    }

    // Callback abort propagates its message.
    std::string err;
    std::uint64_t seen = 0;
    bool ok = for_each_line(
        tmp.file("trailing.txt"),
        [&](const std::string &, std::uint64_t line_no, std::string &cb_err)
        {
            seen = line_no;
            cb_err = "stop";
            return false;
        },
        err);
    assert(!ok);
    assert(seen == 1);
    assert(err.find("stop") != std::string::npos);

    return 0;
}
