#include "copy/ProgressReporter.hpp"

#include <fmt/core.h>

using namespace ci::copy;

ProgressReporter::ProgressReporter(std::ostream& out, const std::chrono::milliseconds interval, const bool overwriteLine)
    : out_(out), interval_(interval), overwriteLine_(overwriteLine) {}

std::string ProgressReporter::progressLine(const ResultSnapshot& c) {
    return fmt::format("progress: {}/{} copied, {} skipped, {} errors", c.copied, c.total, c.skipped, c.errors);
}

std::string ProgressReporter::summaryLine(const ResultSnapshot& c) {
    auto line = fmt::format("done: {} copied, {} skipped", c.copied, c.skipped);
    if (c.errors > 0) line += fmt::format(", {} errors", c.errors);
    return line;
}

void ProgressReporter::write(const std::string& line) {
    if (overwriteLine_) out_ << '\r' << line << "\x1b[K";
    else out_ << line << '\n';
    out_.flush();
    ++emitted_;
}

void ProgressReporter::report(const Progress& progress) {
    std::scoped_lock lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (any_ && now - last_ < interval_) return;

    any_ = true;
    last_ = now;
    write(progressLine(progress.counts));
}

void ProgressReporter::finish(const ResultSnapshot& counts) {
    std::scoped_lock lock(mutex_);
    write(progressLine(counts));
    if (overwriteLine_) out_ << '\n';
    out_ << summaryLine(counts) << '\n';
    out_.flush();
}

size_t ProgressReporter::emitted() const {
    std::scoped_lock lock(mutex_);
    return emitted_;
}
