#pragma once

#include "copy/Engine.hpp"

#include <chrono>
#include <mutex>
#include <ostream>
#include <string>

namespace ci::copy {

// Rate-limited "progress: ..." line for the copy stage.
// report() may be called from any worker; finish() always prints.
class ProgressReporter {
public:
    explicit ProgressReporter(std::ostream& out,
                              std::chrono::milliseconds interval = std::chrono::milliseconds(500),
                              bool overwriteLine = true);

    void report(const Progress& progress);

    // Final counts plus the summary line
    void finish(const ResultSnapshot& counts);

    [[nodiscard]] size_t emitted() const;

    static std::string progressLine(const ResultSnapshot& counts);
    static std::string summaryLine(const ResultSnapshot& counts);

private:
    std::ostream& out_;
    const std::chrono::milliseconds interval_;
    const bool overwriteLine_;

    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point last_{};
    bool any_ = false;
    size_t emitted_ = 0;

    void write(const std::string& line);
};

}
