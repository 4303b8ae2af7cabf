#pragma once

#include "diagnostics.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RankingContext — per-question state passed through extract, normalize,
// validate and tabulate. Warnings land in the run Diagnostics under
// "ranking:<code>"; items that could not be tabulated are listed so the run
// is marked partial.
// ---------------------------------------------------------------------------
struct RankingContext {
    std::string question_code;
    Diagnostics& diag;
    std::vector<std::string> failed_items;

    RankingContext(std::string code, Diagnostics& d) : question_code(std::move(code)), diag(d) {}

    std::string source() const { return "ranking:" + question_code; }

    void warn(const std::string& message) { diag.warn(source(), message); }

    void item_failed(const std::string& item, const std::string& reason) {
        failed_items.push_back(item);
        diag.warn(source(), "item '" + item + "' not tabulated: " + reason);
    }
};
