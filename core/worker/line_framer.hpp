#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mcprouter {
namespace worker {

// Upper bound for a single buffered line: 32 MiB (tool results may embed base64 payloads)
constexpr size_t kMaxLineSize = 32u * 1024u * 1024u;

// LineFramer splits a raw byte stream into newline-delimited documents.
// Bytes are buffered undecoded, so a multi-byte UTF-8 sequence split across
// two reads is only handed out once its line is complete. A trailing '\r' is
// stripped; blank lines are skipped.
class LineFramer {
public:
    explicit LineFramer(size_t max_line_size = kMaxLineSize);

    // Append bytes and return every line completed by them, in stream order
    std::vector<std::string> feed(const char *data, size_t len);

    // Bytes of the current partial line
    size_t buffered_bytes() const { return buffer_.size(); }

    // Lines discarded for exceeding max_line_size
    size_t oversized_lines() const { return oversized_lines_; }

    // Hand out the partial trailing line (used at EOF) and clear it
    std::string take_remainder();

    void reset();

private:
    size_t max_line_size_;
    std::string buffer_;
    bool discarding_ = false;  // inside an oversized line, skip until next '\n'
    size_t oversized_lines_ = 0;
};

}  // namespace worker
}  // namespace mcprouter
