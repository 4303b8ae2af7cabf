#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ErrorCode — machine-readable failure identifiers
// Prefix convention: CFG_ = configuration, DATA_ = data content,
// ARG_ = caller-supplied argument.
// ---------------------------------------------------------------------------
enum class ErrorCode {
    CFG_INVALID_VALUE,
    CFG_QUESTION_NOT_FOUND,
    CFG_BANNER_QUESTION_NOT_FOUND,
    CFG_BANNER_NO_OPTIONS,
    CFG_BANNER_NO_BOXCATEGORY,
    CFG_BANNER_COLUMN_NOT_FOUND,
    CFG_INVALID_RANKING_FORMAT,
    CFG_COMPOSITE_INVALID,
    CFG_COMPOSITE_WEIGHTS,
    DATA_WEIGHT_COLUMN_NOT_FOUND,
    DATA_INVALID_TYPE,
    DATA_NEGATIVE_WEIGHTS,
    DATA_INVALID_WEIGHTS,
    DATA_NO_VALID_WEIGHTS,
    DATA_COLUMN_NOT_FOUND,
    DATA_INVALID_FORMAT,
    DATA_EMPTY_RANKING,
    DATA_COMPOSITE_ALL_MISSING,
    DATA_FILTER_EVAL_FAILED,
    DATA_LOAD_FAILED,
    ARG_UNSAFE_FILTER,
    ARG_DANGEROUS_FILTER,
    IO_WRITE_FAILED,
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::CFG_INVALID_VALUE:             return "CFG_INVALID_VALUE";
        case ErrorCode::CFG_QUESTION_NOT_FOUND:        return "CFG_QUESTION_NOT_FOUND";
        case ErrorCode::CFG_BANNER_QUESTION_NOT_FOUND: return "CFG_BANNER_QUESTION_NOT_FOUND";
        case ErrorCode::CFG_BANNER_NO_OPTIONS:         return "CFG_BANNER_NO_OPTIONS";
        case ErrorCode::CFG_BANNER_NO_BOXCATEGORY:     return "CFG_BANNER_NO_BOXCATEGORY";
        case ErrorCode::CFG_BANNER_COLUMN_NOT_FOUND:   return "CFG_BANNER_COLUMN_NOT_FOUND";
        case ErrorCode::CFG_INVALID_RANKING_FORMAT:    return "CFG_INVALID_RANKING_FORMAT";
        case ErrorCode::CFG_COMPOSITE_INVALID:         return "CFG_COMPOSITE_INVALID";
        case ErrorCode::CFG_COMPOSITE_WEIGHTS:         return "CFG_COMPOSITE_WEIGHTS";
        case ErrorCode::DATA_WEIGHT_COLUMN_NOT_FOUND:  return "DATA_WEIGHT_COLUMN_NOT_FOUND";
        case ErrorCode::DATA_INVALID_TYPE:             return "DATA_INVALID_TYPE";
        case ErrorCode::DATA_NEGATIVE_WEIGHTS:         return "DATA_NEGATIVE_WEIGHTS";
        case ErrorCode::DATA_INVALID_WEIGHTS:          return "DATA_INVALID_WEIGHTS";
        case ErrorCode::DATA_NO_VALID_WEIGHTS:         return "DATA_NO_VALID_WEIGHTS";
        case ErrorCode::DATA_COLUMN_NOT_FOUND:         return "DATA_COLUMN_NOT_FOUND";
        case ErrorCode::DATA_INVALID_FORMAT:           return "DATA_INVALID_FORMAT";
        case ErrorCode::DATA_EMPTY_RANKING:            return "DATA_EMPTY_RANKING";
        case ErrorCode::DATA_COMPOSITE_ALL_MISSING:    return "DATA_COMPOSITE_ALL_MISSING";
        case ErrorCode::DATA_FILTER_EVAL_FAILED:       return "DATA_FILTER_EVAL_FAILED";
        case ErrorCode::DATA_LOAD_FAILED:              return "DATA_LOAD_FAILED";
        case ErrorCode::ARG_UNSAFE_FILTER:             return "ARG_UNSAFE_FILTER";
        case ErrorCode::ARG_DANGEROUS_FILTER:          return "ARG_DANGEROUS_FILTER";
        case ErrorCode::IO_WRITE_FAILED:               return "IO_WRITE_FAILED";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// CrosstabError — fatal error for a question or a run
// Carries the code, a short title, the concrete problem, its impact on the
// numbers, and how to fix the input.
// ---------------------------------------------------------------------------
class CrosstabError : public std::runtime_error {
public:
    CrosstabError(ErrorCode code, std::string title, std::string problem,
                  std::string why_it_matters = "", std::string how_to_fix = "")
        : std::runtime_error(std::string("[") + error_code_str(code) + "] " +
                             title + ": " + problem),
          code_(code),
          title_(std::move(title)),
          problem_(std::move(problem)),
          why_it_matters_(std::move(why_it_matters)),
          how_to_fix_(std::move(how_to_fix)) {}

    ErrorCode code() const { return code_; }
    const std::string& title() const { return title_; }
    const std::string& problem() const { return problem_; }
    const std::string& why_it_matters() const { return why_it_matters_; }
    const std::string& how_to_fix() const { return how_to_fix_; }

private:
    ErrorCode code_;
    std::string title_;
    std::string problem_;
    std::string why_it_matters_;
    std::string how_to_fix_;
};

// ---------------------------------------------------------------------------
// Warning / SkippedTest — non-fatal findings
// ---------------------------------------------------------------------------
struct Warning {
    std::string source;   // e.g. "weighting", "ranking:Q7"
    std::string message;
};

struct SkippedTest {
    std::string question;
    std::string scope;    // row label or "chi-square"
    std::string reason;
};

// ---------------------------------------------------------------------------
// Diagnostics — collector threaded through the engine
// Library code records here and never prints.
// ---------------------------------------------------------------------------
class Diagnostics {
public:
    void warn(const std::string& source, const std::string& message) {
        warnings_.push_back({source, message});
    }

    void info(const std::string& source, const std::string& message) {
        infos_.push_back({source, message});
    }

    void skipped_test(const std::string& question, const std::string& scope,
                      const std::string& reason) {
        skipped_tests_.push_back({question, scope, reason});
    }

    void merge(const Diagnostics& other) {
        warnings_.insert(warnings_.end(), other.warnings_.begin(), other.warnings_.end());
        infos_.insert(infos_.end(), other.infos_.begin(), other.infos_.end());
        skipped_tests_.insert(skipped_tests_.end(),
                              other.skipped_tests_.begin(), other.skipped_tests_.end());
    }

    bool has_warning_containing(const std::string& needle) const {
        for (const auto& w : warnings_) {
            if (w.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    const std::vector<Warning>& warnings() const { return warnings_; }
    const std::vector<Warning>& infos() const { return infos_; }
    const std::vector<SkippedTest>& skipped_tests() const { return skipped_tests_; }

private:
    std::vector<Warning> warnings_;
    std::vector<Warning> infos_;
    std::vector<SkippedTest> skipped_tests_;
};
