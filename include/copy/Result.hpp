#pragma once

#include <atomic>
#include <cstddef>

namespace ci::copy {

// Vanished: source gone before it could be copied. Planned: dry run, nothing written.
enum class Outcome { Copied, Skipped, Error, Vanished, Planned };

struct ResultSnapshot {
    size_t copied = 0;
    size_t skipped = 0;
    size_t errors = 0;
    size_t total = 0;

    bool operator==(const ResultSnapshot&) const = default;
};

// Counters shared by every copy worker. Monotonic for the run.
class Result {
public:
    void record(const Outcome outcome) {
        switch (outcome) {
            case Outcome::Copied:   copied_.fetch_add(1, std::memory_order_relaxed); break;
            case Outcome::Skipped:  skipped_.fetch_add(1, std::memory_order_relaxed); break;
            case Outcome::Error:    errors_.fetch_add(1, std::memory_order_relaxed); break;
            case Outcome::Vanished:
            case Outcome::Planned:  break;
        }
        total_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] ResultSnapshot snapshot() const {
        return {copied_.load(), skipped_.load(), errors_.load(), total_.load()};
    }

private:
    std::atomic<size_t> copied_{0}, skipped_{0}, errors_{0}, total_{0};
};

}
