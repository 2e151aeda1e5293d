#include "agent/insight_reporter.hpp"
#include "agent/action_set.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace phenom {

namespace {

// An axis dominates when its error is at least this multiple of every other.
constexpr double kDominanceRatio = 2.0;

} // namespace

std::string InsightReporter::inferTopic(const SurpriseReading& reading) const {
    if (reading.first_time) return "Novel region";

    static const char* axis_names[] = {"x", "y", "z"};
    const Vec3& e = reading.axis_error;
    size_t top = static_cast<size_t>(std::max_element(e.begin(), e.end()) - e.begin());

    bool dominant = true;
    for (size_t i = 0; i < 3; i++) {
        if (i != top && e[top] < kDominanceRatio * e[i]) dominant = false;
    }
    if (dominant) {
        return std::string("Anomaly on the ") + axis_names[top] + " axis";
    }
    return "Anomaly across coupled axes";
}

Insight InsightReporter::compose(const SurpriseReading& reading) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "surprise=" << reading.surprise;
    if (!reading.first_time) {
        oss << " (prediction error " << reading.raw_error << ")";
    }
    oss << " in state " << reading.state
        << " after " << perturbationLabel(reading.action);
    return Insight{inferTopic(reading), oss.str()};
}

TextDiscovery InsightReporter::statusSummary(uint64_t step, size_t distinct_states,
                                             size_t model_entries, double novelty,
                                             double exploration_rate) const {
    std::ostringstream oss;
    oss << "Scientist: step " << step << ", "
        << distinct_states << " distinct states visited, "
        << model_entries << " world-model entries, "
        << std::fixed << std::setprecision(3)
        << "novelty " << novelty << ", exploration " << exploration_rate;
    return TextDiscovery{oss.str()};
}

} // namespace phenom
