#include "signspace/types.hpp"
#include "signspace/error.hpp"

#include <algorithm>
#include <cctype>

namespace signspace {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

// =============================================================================
// Context tags
// =============================================================================

const char* context_tag_name(ContextTag tag) noexcept {
    switch (tag) {
        case ContextTag::Educational:    return "educational";
        case ContextTag::Conversational: return "conversational";
        case ContextTag::Narrative:      return "narrative";
        case ContextTag::Technical:      return "technical";
        case ContextTag::Custom:         return "custom";
    }
    return "unknown";
}

std::optional<ContextTag> parse_context_tag(std::string_view name) noexcept {
    const std::string lower = to_lower(name);
    if (lower == "educational") return ContextTag::Educational;
    if (lower == "conversational") return ContextTag::Conversational;
    if (lower == "narrative") return ContextTag::Narrative;
    if (lower == "technical") return ContextTag::Technical;
    if (lower == "custom") return ContextTag::Custom;
    return std::nullopt;
}

std::string CulturalContext::tag_label() const {
    if (tag == ContextTag::Custom && !custom_tag.empty()) {
        return custom_tag;
    }
    return context_tag_name(tag);
}

bool CulturalContext::parameter_flag(const std::string& key) const {
    auto it = parameters.find(key);
    if (it == parameters.end()) return false;
    const std::string value = to_lower(it->second);
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::string CulturalContext::parameter_or(const std::string& key, const std::string& fallback) const {
    auto it = parameters.find(key);
    return (it != parameters.end() && !it->second.empty()) ? it->second : fallback;
}

// =============================================================================
// Error codes / log levels
// =============================================================================

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:                     return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_FOUND:                   return "NOT_FOUND";
        case ErrorCode::GENERATION_FAILED:           return "GENERATION_FAILED";
        case ErrorCode::ZONE_GENERATION_FAILED:      return "ZONE_GENERATION_FAILED";
        case ErrorCode::PROFORME_PREPARATION_FAILED: return "PROFORME_PREPARATION_FAILED";
        case ErrorCode::ANALYSIS_FAILED:             return "ANALYSIS_FAILED";
        case ErrorCode::LAYOUT_INVALID:              return "LAYOUT_INVALID";
        case ErrorCode::LAYOUT_EMPTY:                return "LAYOUT_EMPTY";
        case ErrorCode::VALIDATION_FAILED:           return "VALIDATION_FAILED";
        case ErrorCode::INTERNAL_ERROR:              return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

} // namespace signspace
