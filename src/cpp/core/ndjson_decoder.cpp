#include "steward/ndjson_decoder.h"

namespace steward {

std::vector<ProgressRecord> NdjsonDecoder::feed(const char* data, size_t len) {
    std::vector<ProgressRecord> records;
    buffer_.append(data, len);

    size_t start = 0;
    size_t pos;
    while ((pos = buffer_.find('\n', start)) != std::string::npos) {
        decode_line(buffer_.substr(start, pos - start), records);
        start = pos + 1;
    }
    buffer_.erase(0, start);

    return records;
}

std::vector<ProgressRecord> NdjsonDecoder::finish() {
    std::vector<ProgressRecord> records;
    if (!buffer_.empty()) {
        decode_line(buffer_, records);
        buffer_.clear();
    }
    return records;
}

void NdjsonDecoder::decode_line(const std::string& line, std::vector<ProgressRecord>& out) {
    // Trim whitespace (including the '\r' of CRLF streams)
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return;
    }
    size_t last = line.find_last_not_of(" \t\r");
    std::string trimmed = line.substr(first, last - first + 1);

    json parsed = json::parse(trimmed, nullptr, false);
    if (parsed.is_discarded()) {
        skipped_lines_++;
        return;
    }

    auto record = ProgressRecord::from_json(parsed);
    if (!record) {
        skipped_lines_++;
        return;
    }
    out.push_back(std::move(*record));
}

} // namespace steward
