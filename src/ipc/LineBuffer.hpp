#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace schedview {
namespace ipc {

/**
 * Reassembles '\n' delimited messages from a byte stream. TCP may deliver a
 * message in pieces or several messages in one read; feed every chunk to
 * append() and take the completed lines with nextLine().
 */
class LineBuffer {
public:
    explicit LineBuffer(std::size_t maxLineLength = 64 * 1024)
        : maxLineLength_(maxLineLength) {}

    /**
     * Add received bytes. Complete lines are queued without their
     * terminator; empty lines and a trailing '\r' are dropped.
     */
    void append(const char* data, std::size_t size);

    /** Pop the oldest complete line. False when none is queued. */
    bool nextLine(std::string& line);

    /**
     * True once a line grew past the limit. Lines completed before the
     * oversized one stay queued; nothing after it is accepted.
     */
    bool overflowed() const { return overflowed_; }

    /** Bytes held for an incomplete line. */
    std::size_t pending() const { return buffer_.size(); }

    /** Complete lines not yet taken. */
    std::size_t queued() const { return lines_.size(); }

    void clear() {
        buffer_.clear();
        lines_.clear();
        overflowed_ = false;
    }

private:
    std::string buffer_;
    std::deque<std::string> lines_;
    std::size_t maxLineLength_;
    bool overflowed_{false};
};

} // namespace ipc
} // namespace schedview
