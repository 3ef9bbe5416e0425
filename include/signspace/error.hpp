#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace signspace {

/**
 * Structured error reporting for signing-space generation and analysis.
 * Every exception carries a code, the function it was raised from, and an
 * optional suggestion for the caller.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_FOUND = 2,

    // Structure synthesis
    GENERATION_FAILED = 100,
    ZONE_GENERATION_FAILED = 101,
    PROFORME_PREPARATION_FAILED = 102,
    ANALYSIS_FAILED = 103,

    // Layout
    LAYOUT_INVALID = 200,
    LAYOUT_EMPTY = 201,

    // Coherence validation
    VALIDATION_FAILED = 300,

    // Internal errors
    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code) noexcept;

class SignspaceException : public std::runtime_error {
public:
    explicit SignspaceException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Signspace error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public SignspaceException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : SignspaceException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Any failure while synthesizing zones, proformes or elements
class StructureGenerationError : public SignspaceException {
public:
    using Details = std::map<std::string, std::string>;

    explicit StructureGenerationError(const std::string& message,
                                      ErrorCode code = ErrorCode::GENERATION_FAILED,
                                      Details details = {},
                                      const std::string& context = "")
        : SignspaceException(code, message, context)
        , details_(std::move(details)) {}

    const Details& details() const noexcept { return details_; }

private:
    Details details_;
};

// A generated layout failed its own validity check
class LayoutError : public SignspaceException {
public:
    explicit LayoutError(const std::string& message,
                         ErrorCode code = ErrorCode::LAYOUT_INVALID,
                         const std::string& context = "")
        : SignspaceException(code, message, context,
                             "Check that zones are non-empty and every element resolves to a zone") {}
};

// One or more coherence metrics fell below the acceptance threshold
class ValidationError : public SignspaceException {
public:
    using Scores = std::map<std::string, double>;

    ValidationError(const std::string& message, Scores scores, double threshold,
                    const std::string& context = "")
        : SignspaceException(ErrorCode::VALIDATION_FAILED, message, context)
        , scores_(std::move(scores))
        , threshold_(threshold) {}

    const Scores& scores() const noexcept { return scores_; }
    double threshold() const noexcept { return threshold_; }

private:
    Scores scores_;
    double threshold_;
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw SignspaceException(code, message, context, suggestion);
        }
    }
};

#define SIGNSPACE_CHECK(condition, code, message) \
    signspace::ErrorHandler::check_condition(condition, code, message, __func__)

#define SIGNSPACE_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw signspace::InvalidArgumentError(message, __func__); } while (0)

#define SIGNSPACE_THROW(code, message) \
    throw signspace::SignspaceException(code, message, __func__)

} // namespace signspace
