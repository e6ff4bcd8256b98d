#include "fallwatch/sensitivity_profile.hpp"

#include <cctype>
#include <iostream>

namespace fallwatch {

namespace {
std::string canonical(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}
}  // namespace

Sensitivity parse_sensitivity(const std::string& name) {
    const std::string c = canonical(name);
    if (c == "low") return Sensitivity::LOW;
    if (c == "medium") return Sensitivity::MEDIUM;
    if (c == "high") return Sensitivity::HIGH;
    std::cerr << "[WARN] Unknown sensitivity '" << name << "', using medium" << std::endl;
    return Sensitivity::MEDIUM;
}

Thresholds thresholds_for(Sensitivity s) {
    switch (s) {
        case Sensitivity::LOW: return Thresholds{25.0, 50.0, 1.5};
        case Sensitivity::MEDIUM: return Thresholds{35.0, 30.0, 1.3};
        case Sensitivity::HIGH: return Thresholds{45.0, 20.0, 1.1};
    }
    return Thresholds{35.0, 30.0, 1.3};
}

}  // namespace fallwatch
