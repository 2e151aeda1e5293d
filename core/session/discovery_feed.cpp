#include "session/discovery_feed.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <stdexcept>

namespace phenom {

DiscoveryFeed::DiscoveryFeed(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("DiscoveryFeed: capacity must be positive");
    }
}

void DiscoveryFeed::push(const DiscoveryEvent& event) {
    events_.push_back(event);
    total_pushed_++;
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<DiscoveryEvent> DiscoveryFeed::events() const {
    return std::vector<DiscoveryEvent>(events_.begin(), events_.end());
}

std::vector<DiscoveryEvent> DiscoveryFeed::recent(size_t n) const {
    std::vector<DiscoveryEvent> result;
    for (auto it = events_.rbegin(); it != events_.rend() && result.size() < n; ++it) {
        result.push_back(*it);
    }
    return result;
}

bool DiscoveryFeed::exportToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        logger()->warn("feed: cannot open '{}' for writing", path);
        return false;
    }
    for (const auto& event : events_) {
        out << encodeDiscovery(event) << "\n";
    }
    return static_cast<bool>(out);
}

size_t DiscoveryFeed::importFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        logger()->warn("feed: cannot open '{}' for reading", path);
        return 0;
    }
    size_t imported = 0;
    size_t line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        auto event = decodeDiscovery(line);
        if (!event) {
            logger()->debug("feed: skipping malformed line {} in '{}'", line_no, path);
            continue;
        }
        push(*event);
        imported++;
    }
    return imported;
}

} // namespace phenom
