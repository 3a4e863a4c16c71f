#include <catch2/catch_test_macros.hpp>

#include "worker_client.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> worker_argv(const std::string& idle_seconds) {
    return {FUNASR_SRT_BIN, "--worker", "--no-history",
            "--config", "/tmp/funasr_test_nonexistent_config.json",
            "--idle-seconds", idle_seconds,
            "--out-dir", (std::filesystem::temp_directory_path() / "funasr_test_process").string()};
}

} // namespace

TEST_CASE("Worker process", "[process]") {
    WorkerClient client;

    SECTION("AnnouncesReadyWithItsPid") {
        REQUIRE(client.start(worker_argv("30")));
        json ready;
        REQUIRE(client.wait_ready(ready, 10000));
        REQUIRE(ready["type"] == "ready");
        REQUIRE(ready["pid"] == client.pid());
        REQUIRE(ready["idleSeconds"] == 30);

        client.stop();
        REQUIRE(client.wait_exit(0) == 0);
    }

    SECTION("ExitsWhenIdle") {
        REQUIRE(client.start(worker_argv("1")));
        json ready;
        REQUIRE(client.wait_ready(ready, 10000));

        auto start = std::chrono::steady_clock::now();
        auto status = client.wait_exit(5000);
        REQUIRE(status);
        REQUIRE(*status == 0);
        REQUIRE(std::chrono::steady_clock::now() - start >= 900ms);
        REQUIRE_FALSE(client.running());
    }

    SECTION("ErrorsThenShutdown") {
        REQUIRE(client.start(worker_argv("30")));
        json ready;
        REQUIRE(client.wait_ready(ready, 10000));

        json resp;
        REQUIRE(client.send({{"id", 1}, {"type", "transcribe"}, {"audioPath", "/nonexistent/a.wav"}}));
        REQUIRE(client.recv(resp, 10000));
        REQUIRE(resp["type"] == "result");
        REQUIRE(resp["id"] == 1);
        REQUIRE(resp["ok"] == false);
        REQUIRE(resp.contains("traceback"));

        REQUIRE(client.send_line("{not json"));
        REQUIRE(client.recv(resp, 10000));
        REQUIRE(resp["id"].is_null());
        REQUIRE(resp["ok"] == false);

        REQUIRE(client.send({{"id", 2}, {"type", "shutdown"}}));
        REQUIRE(client.recv(resp, 10000));
        REQUIRE(resp == json{{"type", "shutdown"}, {"id", 2}, {"ok", true}});

        REQUIRE(client.wait_exit(5000) == 0);
    }

    SECTION("ExitsAtEndOfInput") {
        REQUIRE(client.start(worker_argv("30")));
        json ready;
        REQUIRE(client.wait_ready(ready, 10000));

        client.close_input();
        REQUIRE(client.wait_exit(5000) == 0);
    }
}

TEST_CASE("Worker client handshake", "[process]") {
    WorkerClient client;

    SECTION("SkipsNonObjectLinesBeforeReady") {
        // Stray JSON values a worker's dependencies might print to stdout.
        REQUIRE(client.start({"/bin/sh", "-c",
                              "echo 42; echo '[1, 2]'; echo '\"ready\"'; echo null; "
                              "echo '{\"type\": \"log\"}'; "
                              "echo '{\"type\": \"ready\", \"pid\": 7}'; cat >/dev/null"}));
        json ready;
        REQUIRE(client.wait_ready(ready, 5000));
        REQUIRE(ready["pid"] == 7);

        client.close_input();
        REQUIRE(client.wait_exit(5000) == 0);
    }

    SECTION("GivesUpWhenReadyNeverComes") {
        REQUIRE(client.start({"/bin/sh", "-c", "echo 42; echo '\"ready\"'"}));
        json ready;
        REQUIRE_FALSE(client.wait_ready(ready, 5000));
        REQUIRE(client.wait_exit(5000) == 0);
    }
}
