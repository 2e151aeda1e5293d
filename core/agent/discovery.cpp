#include "agent/discovery.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

namespace phenom {

namespace {

std::string escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> unescape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] != '\\') {
            out.push_back(in[i]);
            continue;
        }
        if (++i >= in.size()) return std::nullopt;
        switch (in[i]) {
            case '\\': out.push_back('\\'); break;
            case 't': out.push_back('\t'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            default: return std::nullopt;
        }
    }
    return out;
}

// Splits on raw tabs; escaped tabs never appear as raw tabs.
std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    for (char c : line) {
        if (c == '\t') {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(current);
    return fields;
}

} // namespace

std::string describe(const DiscoveryEvent& event) {
    std::ostringstream oss;
    if (const auto* text = std::get_if<TextDiscovery>(&event)) {
        oss << text->message;
    } else if (const auto* insight = std::get_if<Insight>(&event)) {
        oss << "HYPOTHESIS: " << insight->topic << " - " << insight->content;
    } else if (const auto* det = std::get_if<Detection>(&event)) {
        oss << "DETECTION: " << det->label << " ("
            << static_cast<int>(std::lround(det->confidence * 100.0)) << "%)";
    }
    return oss.str();
}

std::string encodeDiscovery(const DiscoveryEvent& event) {
    std::ostringstream oss;
    if (const auto* text = std::get_if<TextDiscovery>(&event)) {
        oss << "text\t" << escape(text->message);
    } else if (const auto* insight = std::get_if<Insight>(&event)) {
        oss << "insight\t" << escape(insight->topic) << "\t" << escape(insight->content);
    } else if (const auto* det = std::get_if<Detection>(&event)) {
        oss << "detection\t" << escape(det->label) << "\t"
            << std::setprecision(17) << det->confidence;
    }
    return oss.str();
}

std::optional<DiscoveryEvent> decodeDiscovery(const std::string& line) {
    std::vector<std::string> fields = splitFields(line);
    const std::string& kind = fields[0];

    if (kind == "text" && fields.size() == 2) {
        auto message = unescape(fields[1]);
        if (!message) return std::nullopt;
        return DiscoveryEvent(TextDiscovery{*message});
    }
    if (kind == "insight" && fields.size() == 3) {
        auto topic = unescape(fields[1]);
        auto content = unescape(fields[2]);
        if (!topic || !content) return std::nullopt;
        return DiscoveryEvent(Insight{*topic, *content});
    }
    if (kind == "detection" && fields.size() == 3) {
        auto label = unescape(fields[1]);
        if (!label) return std::nullopt;
        std::istringstream iss(fields[2]);
        double confidence = 0.0;
        if (!(iss >> confidence) || !iss.eof()) return std::nullopt;
        return DiscoveryEvent(Detection{*label, confidence});
    }
    return std::nullopt;
}

} // namespace phenom
