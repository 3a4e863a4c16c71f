#include "line_channel.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <print>
#include <unistd.h>

LineChannel::LineChannel(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

std::optional<std::string> LineChannel::read_line(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        auto pos = buf_.find('\n');
        if (pos != std::string::npos) {
            std::string line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        if (eof_) {
            if (buf_.empty()) return std::nullopt;
            std::string line;
            line.swap(buf_);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) return std::nullopt;

            pollfd pfd{.fd = in_fd_, .events = POLLIN, .revents = 0};
            int ret = ::poll(&pfd, 1, static_cast<int>(left));
            if (ret < 0) {
                if (errno == EINTR) continue;
                return std::nullopt;
            }
            if (ret == 0) return std::nullopt;
        }

        char tmp[4096];
        ssize_t n = ::read(in_fd_, tmp, sizeof(tmp));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "channel: read failed: {}", std::strerror(errno));
            eof_ = true;
            continue;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buf_.append(tmp, static_cast<size_t>(n));
    }
}

bool LineChannel::write_message(const nlohmann::json& msg) {
    return write_line(msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

bool LineChannel::write_line(const std::string& text) {
    std::string line = text + "\n";

    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::write(out_fd_, line.data() + off, line.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "channel: write failed: {}", std::strerror(errno));
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}
