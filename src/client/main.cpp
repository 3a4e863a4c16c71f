#include "worker_client.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] AUDIO...", prog);
    std::println(stderr, "Transcribes each file through one persistent funasr-srt worker.");
    std::println(stderr, "Options:");
    std::println(stderr, "  --worker-bin PATH   funasr-srt executable");
    std::println(stderr, "  --out-dir DIR       Output directory for every file");
    std::println(stderr, "  --idle-seconds N    Worker idle timeout");
    std::println(stderr, "  --write-json        Also write <base>.funasr.json");
    std::println(stderr, "  --config PATH       Config file passed to the worker");
    std::println(stderr, "  -v, --verbose       Verbose worker logging");
}

int main(int argc, char* argv[]) {
    std::string worker_bin = WorkerClient::default_worker_path(argv[0]);
    std::string out_dir;
    std::string idle_seconds;
    std::string config_path;
    bool write_json = false;
    bool verbose = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--worker-bin" && i + 1 < argc) {
            worker_bin = argv[++i];
        } else if (arg == "--out-dir" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg == "--idle-seconds" && i + 1 < argc) {
            idle_seconds = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--write-json") {
            write_json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> worker_args = {worker_bin, "--worker"};
    if (!idle_seconds.empty()) {
        worker_args.push_back("--idle-seconds");
        worker_args.push_back(idle_seconds);
    }
    if (!config_path.empty()) {
        worker_args.push_back("--config");
        worker_args.push_back(config_path);
    }
    if (verbose) worker_args.push_back("--verbose");

    WorkerClient client;
    if (!client.start(worker_args)) {
        std::println(stderr, "Failed to start worker {}", worker_bin);
        return 1;
    }

    json ready;
    if (!client.wait_ready(ready)) {
        std::println(stderr, "Worker did not become ready");
        return 1;
    }
    if (verbose) {
        std::println(stderr, "Worker ready: pid {} on {}", ready.value("pid", 0),
                     ready.value("device", ""));
    }

    int failures = 0;
    int next_id = 1;
    for (auto& file : files) {
        json req = {{"id", next_id++}, {"type", "transcribe"}, {"audioPath", file},
                    {"writeJson", write_json}};
        if (!out_dir.empty()) req["outDir"] = out_dir;

        json resp;
        // Recognition of a long file can take a while.
        if (!client.send(req) || !client.recv(resp, 3600 * 1000)) {
            std::println(stderr, "{}: worker stopped responding", file);
            return 1;
        }
        if (!resp.is_object()) {
            std::println(stderr, "{}: unexpected response from worker: {}", file, resp.dump());
            return 1;
        }

        if (resp.value("ok", false)) {
            std::println("{}", resp.value("srtPath", ""));
        } else {
            ++failures;
            std::println(stderr, "{}: {}", file, resp.value("error", "unknown error"));
            std::print(stderr, "{}", resp.value("traceback", ""));
        }
    }

    client.stop();
    return failures > 0 ? 1 : 0;
}
