#include "LineBuffer.hpp"

#include <utility>

namespace schedview {
namespace ipc {

void LineBuffer::append(const char* data, std::size_t size) {
    if (overflowed_) {
        return;
    }
    buffer_.append(data, size);

    std::size_t start = 0;
    for (;;) {
        std::size_t newline = buffer_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::size_t end = newline;
        if (end > start && buffer_[end - 1] == '\r') {
            --end;
        }
        if (end - start > maxLineLength_) {
            overflowed_ = true;
            buffer_.clear();
            return;
        }
        if (end > start) {
            lines_.emplace_back(buffer_, start, end - start);
        }
        start = newline + 1;
    }
    buffer_.erase(0, start);
    if (buffer_.size() > maxLineLength_) {
        overflowed_ = true;
        buffer_.clear();
    }
}

bool LineBuffer::nextLine(std::string& line) {
    if (lines_.empty()) {
        return false;
    }
    line = std::move(lines_.front());
    lines_.pop_front();
    return true;
}

} // namespace ipc
} // namespace schedview
