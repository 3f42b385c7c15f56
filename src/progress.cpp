#include "parabin/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace parabin
{

std::string format_duration(double seconds)
{
    int sec = static_cast<int>(seconds + 0.5);
    int h = sec / 3600;
    int m = (sec % 3600) / 60;
    int s = sec % 60;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
    return oss.str();
}

ProgressTracker::ProgressTracker(std::uint64_t total_files, const std::string &label, std::uint64_t interval_ms)
    : label_(label), total_(total_files), interval_ms_(interval_ms)
{
    start_ = std::chrono::steady_clock::now();
    last_print_ = start_;
}

void ProgressTracker::add(std::uint64_t files, std::uint64_t lines)
{
    done_files_ += files;
    done_lines_ += lines;
    maybe_print(false);
}

void ProgressTracker::finish()
{
    maybe_print(true);
}

void ProgressTracker::maybe_print(bool force)
{
    auto now = std::chrono::steady_clock::now();
    if (!force)
    {
        auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
        if (delta < static_cast<long long>(interval_ms_))
        {
            return;
        }
    }
    last_print_ = now;
    double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
    double line_rate = elapsed > 0.0 ? static_cast<double>(done_lines_) / elapsed : 0.0;
    double pct = 0.0;
    if (total_ > 0)
    {
        pct = 100.0 * static_cast<double>(done_files_) / static_cast<double>(total_);
    }

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (total_ > 0)
    {
        oss << "[" << label_ << "] files " << done_files_ << "/" << total_ << " (" << std::setprecision(1) << pct
            << "%)";
    }
    else
    {
        oss << "[" << label_ << "] files " << done_files_;
    }
    oss << " lines " << done_lines_;
    if (line_rate > 0.0)
    {
        oss << " " << std::setprecision(2) << (line_rate / 1000.0) << " klines/s";
    }
    oss << " elapsed " << format_duration(elapsed);
    oss << "\n";
    std::cerr << oss.str();
}

} // namespace parabin
