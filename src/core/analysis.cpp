#include "signspace/analysis.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace signspace {

const char* component_kind_name(ComponentKind kind) noexcept {
    switch (kind) {
        case ComponentKind::Unknown:     return "unknown";
        case ComponentKind::Zone:        return "zone";
        case ComponentKind::Proforme:    return "proforme";
        case ComponentKind::Pointing:    return "pointing";
        case ComponentKind::Transition:  return "transition";
        case ComponentKind::Gaze:        return "gaze";
        case ComponentKind::Expression:  return "expression";
        case ComponentKind::Orientation: return "orientation";
        case ComponentKind::Movement:    return "movement";
    }
    return "unknown";
}

ComponentKind parse_component_kind(std::string_view label) noexcept {
    std::string lower(label);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto kind : {ComponentKind::Zone, ComponentKind::Proforme, ComponentKind::Pointing,
                      ComponentKind::Transition, ComponentKind::Gaze, ComponentKind::Expression,
                      ComponentKind::Orientation, ComponentKind::Movement}) {
        if (lower == component_kind_name(kind)) return kind;
    }
    return ComponentKind::Zone;
}

std::string field_to_string(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";

    std::ostringstream oss;
    oss << std::get<double>(value);
    return oss.str();
}

std::optional<std::string> InputRecord::text(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) return std::nullopt;
    return field_to_string(it->second);
}

std::optional<double> InputRecord::number(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) return std::nullopt;
    if (const auto* d = std::get_if<double>(&it->second)) return *d;
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        try {
            size_t consumed = 0;
            double parsed = std::stod(*s, &consumed);
            if (consumed == s->size()) return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

AnalyzerInput AnalyzerInput::from_text(std::string text) {
    AnalyzerInput input;
    input.type = "text";
    input.data = std::move(text);
    return input;
}

AnalyzerInput AnalyzerInput::from_records(StructuredInput records) {
    AnalyzerInput input;
    input.type = "structured";
    input.data = std::move(records);
    return input;
}

} // namespace signspace
