#pragma once

#include "agent/discovery.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace phenom {

// ─── Discovery Feed ───────────────────────────────────────────
// Bounded, append-only history of discoveries for display. When
// full, the oldest entry is dropped to make room.

class DiscoveryFeed {
public:
    static constexpr size_t kDefaultCapacity = 50;

    /// Throws std::invalid_argument for a zero capacity.
    explicit DiscoveryFeed(size_t capacity = kDefaultCapacity);

    /// Append an event, evicting the oldest if at capacity.
    void push(const DiscoveryEvent& event);

    /// All retained events, oldest first.
    std::vector<DiscoveryEvent> events() const;

    /// The n most recent events, newest first (display order).
    std::vector<DiscoveryEvent> recent(size_t n) const;

    size_t count() const { return events_.size(); }
    size_t capacity() const { return capacity_; }

    /// Events pushed over the feed's lifetime, including evicted ones.
    size_t totalPushed() const { return total_pushed_; }

    /// Write one encoded event per line. Returns false if the file can't be opened.
    bool exportToFile(const std::string& path) const;

    /// Append events from a file written by exportToFile. Malformed lines
    /// are skipped. Returns the number of events read.
    size_t importFromFile(const std::string& path);

    void clear() { events_.clear(); }

private:
    size_t capacity_;
    size_t total_pushed_ = 0;
    std::deque<DiscoveryEvent> events_;
};

} // namespace phenom
