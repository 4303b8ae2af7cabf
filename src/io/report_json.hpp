#pragma once

#include "diagnostics.hpp"
#include "runner/crosstab_runner.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace tab_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace detail {

inline void write_warnings(std::ostringstream& ss, const std::vector<Warning>& list) {
    ss << "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"source\":\"" << json_escape(list[i].source) << "\"";
        ss << ",\"message\":\"" << json_escape(list[i].message) << "\"}";
    }
    ss << "]";
}

}  // namespace detail

// Serialize a RunReport's status and findings (not the tables) to JSON
inline std::string report_to_json(const RunReport& report) {
    std::ostringstream ss;
    ss.precision(15);
    ss << "{";
    ss << "\"status\":\"" << run_status_str(report.status) << "\"";
    ss << ",\"tables\":" << report.tables.size();
    ss << ",\"weighted\":" << (report.weighted ? "true" : "false");
    if (report.weighted) {
        ss << ",\"weights\":{";
        ss << "\"n_positive\":" << report.weights.n_positive;
        ss << ",\"n_zero\":" << report.weights.n_zero;
        ss << ",\"sum\":" << report.weights.sum;
        ss << ",\"cv\":" << report.weights.cv;
        ss << ",\"effective_n\":" << report.weights.effective_n;
        ss << ",\"design_effect\":" << report.weights.design_effect;
        ss << "}";
    }

    ss << ",\"questions\":[";
    for (size_t i = 0; i < report.outcomes.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& o = report.outcomes[i];
        ss << "{\"code\":\"" << json_escape(o.code) << "\"";
        ss << ",\"skipped\":" << (o.skipped ? "true" : "false");
        if (o.skipped) ss << ",\"skip_reason\":\"" << json_escape(o.skip_reason) << "\"";
        if (!o.failed_items.empty()) {
            ss << ",\"failed_items\":[";
            for (size_t k = 0; k < o.failed_items.size(); ++k) {
                if (k > 0) ss << ",";
                ss << "\"" << json_escape(o.failed_items[k]) << "\"";
            }
            ss << "]";
        }
        ss << ",\"resumed\":" << (o.resumed ? "true" : "false");
        ss << ",\"rows\":" << o.row_count;
        ss << "}";
    }
    ss << "]";

    ss << ",\"warnings\":";
    detail::write_warnings(ss, report.diagnostics.warnings());
    ss << ",\"info\":";
    detail::write_warnings(ss, report.diagnostics.infos());

    ss << ",\"skipped_tests\":[";
    const auto& tests = report.diagnostics.skipped_tests();
    for (size_t i = 0; i < tests.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"question\":\"" << json_escape(tests[i].question) << "\"";
        ss << ",\"scope\":\"" << json_escape(tests[i].scope) << "\"";
        ss << ",\"reason\":\"" << json_escape(tests[i].reason) << "\"}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

}  // namespace tab_io
