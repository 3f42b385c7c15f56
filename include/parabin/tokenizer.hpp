#pragma once

#include <functional>
#include <string>
#include <vector>

namespace parabin
{

// Splits one raw line into words. Implementations must be deterministic and
// must not keep state between calls.
using TokenizeFn = std::function<std::vector<std::string>(const std::string &line)>;

// Collapses runs of ASCII whitespace, strips both ends and splits on the remaining
// single spaces.
std::vector<std::string> split_whitespace_words(const std::string &line);

TokenizeFn default_tokenizer();

} // namespace parabin
