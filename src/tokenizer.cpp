#include "parabin/tokenizer.hpp"

#include <cctype>

namespace parabin
{

std::vector<std::string> split_whitespace_words(const std::string &line)
{
    std::vector<std::string> out;
    std::string cur;
    for (char c : line)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (!cur.empty())
            {
                out.push_back(cur);
                cur.clear();
            }
        }
        else
        {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
    {
        out.push_back(cur);
    }
    return out;
}

TokenizeFn default_tokenizer()
{
    return [](const std::string &line) { return split_whitespace_words(line); };
}

} // namespace parabin
