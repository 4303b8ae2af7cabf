#pragma once

#include "diagnostics.hpp"

#include <arrow/api.h>

#include <string>
#include <utility>

namespace tab_io {

// Turn a failed Arrow status into a CrosstabError.
inline void check(const arrow::Status& status, ErrorCode code, const std::string& context) {
    if (status.ok()) return;
    throw CrosstabError(code, code == ErrorCode::IO_WRITE_FAILED ? "Write Failed" : "Read Failed",
                        context + ": " + status.ToString());
}

template <typename T>
T value_or_throw(arrow::Result<T> result, ErrorCode code, const std::string& context) {
    check(result.status(), code, context);
    return result.MoveValueUnsafe();
}

}  // namespace tab_io
