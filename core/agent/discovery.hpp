#pragma once

#include <optional>
#include <string>
#include <variant>

namespace phenom {

// ─── Discovery Events ─────────────────────────────────────────
// Qualitative reports an experimenter publishes for display.
// Separate from the agent's numeric learning signal.

struct TextDiscovery {
    std::string message;

    bool operator==(const TextDiscovery& o) const { return message == o.message; }
};

/// A named hypothesis or finding.
struct Insight {
    std::string topic;
    std::string content;

    bool operator==(const Insight& o) const {
        return topic == o.topic && content == o.content;
    }
};

/// An object the experimenter believes it recognised, with confidence in [0, 1].
struct Detection {
    std::string label;
    double confidence = 0.0;

    bool operator==(const Detection& o) const {
        return label == o.label && confidence == o.confidence;
    }
};

using DiscoveryEvent = std::variant<TextDiscovery, Insight, Detection>;

/// Display string, e.g. "HYPOTHESIS: <topic> - <content>".
std::string describe(const DiscoveryEvent& event);

/// Stable single-line encoding: kind, then tab-separated escaped fields.
std::string encodeDiscovery(const DiscoveryEvent& event);

/// Inverse of encodeDiscovery. Returns nullopt on malformed lines.
std::optional<DiscoveryEvent> decodeDiscovery(const std::string& line);

} // namespace phenom
