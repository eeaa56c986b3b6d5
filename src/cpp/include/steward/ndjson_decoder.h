#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "transfer_types.h"

namespace steward {

// Incremental decoder for newline-delimited JSON progress records.
// Chunks may split a line anywhere; the unterminated tail is kept until the
// next feed(). Blank and malformed lines are skipped.
class NdjsonDecoder {
public:
    std::vector<ProgressRecord> feed(const char* data, size_t len);

    // Decode whatever is left in the buffer (stream ended without a final newline)
    std::vector<ProgressRecord> finish();

    size_t skipped_lines() const { return skipped_lines_; }
    size_t buffered_bytes() const { return buffer_.size(); }

private:
    void decode_line(const std::string& line, std::vector<ProgressRecord>& out);

    std::string buffer_;
    size_t skipped_lines_ = 0;
};

} // namespace steward
