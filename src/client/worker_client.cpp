#include "worker_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

WorkerClient::WorkerClient() = default;

WorkerClient::~WorkerClient() {
    if (running()) stop(2000);
    close_input();
    if (from_child_ >= 0) ::close(from_child_);
}

bool WorkerClient::start(const std::vector<std::string>& argv) {
    if (argv.empty() || pid_ > 0) return false;

    // A worker that died must show up as a failed write.
    ::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2];  // parent -> child stdin
    int out_pipe[2]; // child stdout -> parent
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        std::println(stderr, "client: pipe() failed: {}", std::strerror(errno));
        return false;
    }
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        std::println(stderr, "client: pipe() failed: {}", std::strerror(errno));
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return false;
    }

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "client: fork() failed: {}", std::strerror(errno));
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) ::close(fd);
        return false;
    }

    if (pid == 0) {
        // dup2 clears O_CLOEXEC on the new descriptors.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execv(args[0], args.data());
        std::println(stderr, "client: exec {} failed: {}", argv[0], std::strerror(errno));
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    pid_ = pid;
    to_child_ = in_pipe[1];
    from_child_ = out_pipe[0];
    exit_status_.reset();
    channel_ = std::make_unique<LineChannel>(from_child_, to_child_);
    return true;
}

bool WorkerClient::wait_ready(nlohmann::json& ready, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;

        nlohmann::json msg;
        if (!recv(msg, static_cast<int>(left))) return false;
        if (msg.is_object() && msg.value("type", "") == "ready") {
            ready = std::move(msg);
            return true;
        }
    }
}

bool WorkerClient::send(const nlohmann::json& msg) {
    if (!channel_ || to_child_ < 0) return false;
    return channel_->write_message(msg);
}

bool WorkerClient::send_line(const std::string& line) {
    if (!channel_ || to_child_ < 0) return false;
    return channel_->write_line(line);
}

bool WorkerClient::recv(nlohmann::json& msg, int timeout_ms) {
    if (!channel_) return false;

    auto line = channel_->read_line(timeout_ms);
    if (!line) return false;

    try {
        msg = nlohmann::json::parse(*line);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "client: bad line from worker: {}", e.what());
        return false;
    }
}

void WorkerClient::close_input() {
    if (to_child_ >= 0) {
        ::close(to_child_);
        to_child_ = -1;
    }
}

std::optional<int> WorkerClient::wait_exit(int timeout_ms) {
    if (exit_status_) return exit_status_;
    if (pid_ <= 0) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            if (WIFEXITED(status)) exit_status_ = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) exit_status_ = 128 + WTERMSIG(status);
            else exit_status_ = -1;
            return exit_status_;
        }
        if (r < 0 && errno != EINTR) {
            exit_status_ = -1;
            return exit_status_;
        }
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void WorkerClient::stop(int timeout_ms) {
    if (!running()) return;

    send({{"type", "shutdown"}, {"id", "stop"}});
    close_input();
    if (wait_exit(timeout_ms)) return;

    ::kill(pid_, SIGTERM);
    if (wait_exit(timeout_ms)) return;

    ::kill(pid_, SIGKILL);
    wait_exit(timeout_ms);
}

std::string WorkerClient::default_worker_path(const char* argv0) {
    // funasr-srt is installed next to funasr-srt-client.
    std::filesystem::path self(argv0 ? argv0 : "");
    if (self.has_parent_path()) {
        auto sibling = self.parent_path() / "funasr-srt";
        if (std::filesystem::exists(sibling)) return sibling.string();
    }
    return "/usr/local/bin/funasr-srt";
}
