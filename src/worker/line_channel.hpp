#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Newline-delimited messages over a pair of file descriptors (stdin/stdout
// for the worker, pipes for its client). The descriptors are not owned.
class LineChannel {
public:
    LineChannel(int in_fd, int out_fd);

    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    // Next line without its terminator (a trailing '\r' is dropped too).
    // Blocks for at most timeout_ms, forever when negative. Returns nullopt on
    // timeout, read error or end of input; a final unterminated line is still returned.
    std::optional<std::string> read_line(int timeout_ms = -1);

    // Writes one compact JSON line. Returns false if the peer is gone.
    bool write_message(const nlohmann::json& msg);

    // Writes `line` followed by '\n'.
    bool write_line(const std::string& line);

    bool eof() const { return eof_; }

private:
    int in_fd_;
    int out_fd_;
    std::string buf_;
    bool eof_ = false;
};
