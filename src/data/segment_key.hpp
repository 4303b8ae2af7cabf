#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SegmentKey — validated identifier of one banner column
//
// Text forms:
//   TOTAL::Total                 the Total column
//   <Question>::<Option>         a standard (single or multi-mention) segment
//   <Question>::BOXCAT::<Cat>    a box-category segment
// Components are non-empty; the question code never contains "::" and is
// never TOTAL outside the Total key; a standard option never starts with
// "BOXCAT::".
// ---------------------------------------------------------------------------
class SegmentKey {
public:
    enum class Kind { TOTAL, STANDARD, BOX_CATEGORY };

    static constexpr const char* TOTAL_CODE = "TOTAL";
    static constexpr const char* TOTAL_LABEL = "Total";
    static constexpr const char* BOXCAT_TAG = "BOXCAT";

    static SegmentKey total() {
        return SegmentKey(Kind::TOTAL, TOTAL_CODE, TOTAL_LABEL);
    }

    static SegmentKey standard(const std::string& question, const std::string& option) {
        validate_question(question);
        if (option.empty()) {
            throw std::invalid_argument("SegmentKey: empty option for question " + question);
        }
        if (question == TOTAL_CODE) {
            throw std::invalid_argument("SegmentKey: question code 'TOTAL' is reserved");
        }
        if (option.compare(0, boxcat_prefix().size(), boxcat_prefix()) == 0) {
            throw std::invalid_argument("SegmentKey: option '" + option + "' of question " +
                                        question + " starts with the reserved " +
                                        boxcat_prefix());
        }
        return SegmentKey(Kind::STANDARD, question, option);
    }

    static SegmentKey box_category(const std::string& question, const std::string& category) {
        validate_question(question);
        if (category.empty()) {
            throw std::invalid_argument("SegmentKey: empty box category for question " + question);
        }
        if (question == TOTAL_CODE) {
            throw std::invalid_argument("SegmentKey: question code 'TOTAL' is reserved");
        }
        return SegmentKey(Kind::BOX_CATEGORY, question, category);
    }

    // Parse the text form; throws std::invalid_argument on malformed keys.
    static SegmentKey parse(const std::string& text) {
        size_t sep = text.find("::");
        if (sep == std::string::npos || sep == 0) {
            throw std::invalid_argument("SegmentKey: malformed key '" + text + "'");
        }
        std::string question = text.substr(0, sep);
        std::string rest = text.substr(sep + 2);
        if (question == TOTAL_CODE) {
            if (rest != TOTAL_LABEL) {
                throw std::invalid_argument("SegmentKey: malformed total key '" + text + "'");
            }
            return total();
        }
        if (rest.compare(0, boxcat_prefix().size(), boxcat_prefix()) == 0) {
            return box_category(question, rest.substr(boxcat_prefix().size()));
        }
        return standard(question, rest);
    }

    Kind kind() const { return kind_; }
    bool is_total() const { return kind_ == Kind::TOTAL; }
    const std::string& question() const { return question_; }
    const std::string& value() const { return value_; }

    std::string str() const {
        switch (kind_) {
            case Kind::TOTAL:        return std::string(TOTAL_CODE) + "::" + TOTAL_LABEL;
            case Kind::STANDARD:     return question_ + "::" + value_;
            case Kind::BOX_CATEGORY: return question_ + "::" + BOXCAT_TAG + "::" + value_;
        }
        return {};
    }

    bool operator==(const SegmentKey& o) const {
        return kind_ == o.kind_ && question_ == o.question_ && value_ == o.value_;
    }
    bool operator!=(const SegmentKey& o) const { return !(*this == o); }
    bool operator<(const SegmentKey& o) const { return str() < o.str(); }

private:
    SegmentKey(Kind kind, std::string question, std::string value)
        : kind_(kind), question_(std::move(question)), value_(std::move(value)) {}

    static std::string boxcat_prefix() { return std::string(BOXCAT_TAG) + "::"; }

    static void validate_question(const std::string& question) {
        if (question.empty()) {
            throw std::invalid_argument("SegmentKey: empty question code");
        }
        if (question.find("::") != std::string::npos) {
            throw std::invalid_argument("SegmentKey: question code contains '::': " + question);
        }
    }

    Kind kind_;
    std::string question_;
    std::string value_;
};

struct SegmentKeyHash {
    size_t operator()(const SegmentKey& k) const {
        return std::hash<std::string>{}(k.str());
    }
};
