#include "line_framer.hpp"

#include <cstring>

namespace mcprouter {
namespace worker {

namespace {

bool is_blank(const std::string &line) {
    for (char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

}  // namespace

LineFramer::LineFramer(size_t max_line_size) : max_line_size_(max_line_size) {}

std::vector<std::string> LineFramer::feed(const char *data, size_t len) {
    std::vector<std::string> lines;
    if (data == nullptr || len == 0) {
        return lines;
    }

    size_t pos = 0;
    while (pos < len) {
        const void *found = std::memchr(data + pos, '\n', len - pos);

        if (found == nullptr) {
            // No terminator in the rest of this chunk: carry it over
            if (!discarding_) {
                buffer_.append(data + pos, len - pos);
                if (buffer_.size() > max_line_size_) {
                    buffer_.clear();
                    discarding_ = true;
                    ++oversized_lines_;
                }
            }
            break;
        }

        const size_t nl = static_cast<size_t>(static_cast<const char *>(found) - data);

        if (discarding_) {
            discarding_ = false;
        } else if (buffer_.size() + (nl - pos) > max_line_size_) {
            buffer_.clear();
            ++oversized_lines_;
        } else {
            buffer_.append(data + pos, nl - pos);
            if (!buffer_.empty() && buffer_.back() == '\r') {
                buffer_.pop_back();
            }
            if (!is_blank(buffer_)) {
                lines.push_back(std::move(buffer_));
            }
            buffer_.clear();
        }

        pos = nl + 1;
    }

    return lines;
}

std::string LineFramer::take_remainder() {
    std::string rest;
    if (!discarding_) {
        rest.swap(buffer_);
    }
    reset();
    if (!rest.empty() && rest.back() == '\r') {
        rest.pop_back();
    }
    return rest;
}

void LineFramer::reset() {
    buffer_.clear();
    discarding_ = false;
}

}  // namespace worker
}  // namespace mcprouter
