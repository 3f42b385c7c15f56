#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace parabin
{

// Throttled "[label] files a/b lines n ..." lines on stderr.
class ProgressTracker
{
  public:
    ProgressTracker(std::uint64_t total_files, const std::string &label, std::uint64_t interval_ms);
    void add(std::uint64_t files, std::uint64_t lines);
    void finish();

  private:
    void maybe_print(bool force);

    std::string label_;
    std::uint64_t total_ = 0;
    std::uint64_t interval_ms_ = 1000;
    std::uint64_t done_files_ = 0;
    std::uint64_t done_lines_ = 0;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;
};

std::string format_duration(double seconds);

} // namespace parabin
