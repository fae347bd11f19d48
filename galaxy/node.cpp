#include "node.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace traitgalaxy {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace

TraitVector clamp_traits(TraitVector traits) {
    for (float& value : traits) {
        value = std::clamp(value, kTraitMin, kTraitMax);
    }
    return traits;
}

std::optional<std::string> validate_trait_names(const std::vector<std::string>& names,
                                                size_t expected_count) {
    if (names.size() != expected_count) {
        return "expected " + std::to_string(expected_count) + " trait names, got " +
               std::to_string(names.size());
    }

    std::set<std::string> seen;
    for (const auto& name : names) {
        std::string trimmed = trim(name);
        if (trimmed.empty()) {
            return std::string("trait names must not be blank");
        }
        if (!seen.insert(to_lower(trimmed)).second) {
            return "duplicate trait name: " + trimmed;
        }
    }
    return std::nullopt;
}

}  // namespace traitgalaxy
