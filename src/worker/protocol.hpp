#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

// Line-delimited JSON messages between a caller and `funasr-srt --worker`.
namespace protocol {

// Requests (caller -> worker)

struct TranscribeRequest {
    nlohmann::json id;                 // echoed verbatim, null when absent
    std::string audio_path;
    std::optional<std::string> out_dir;
    std::optional<bool> write_json;
    std::optional<bool> write_orig_srt;
};

struct ShutdownRequest {
    nlohmann::json id;
};

using Request = std::variant<TranscribeRequest, ShutdownRequest>;

// A line that could not be turned into a Request. `id` is null when the line
// was not even a JSON object.
struct RequestError {
    nlohmann::json id;
    std::string message;
};

std::expected<Request, RequestError> parse_request(const std::string& line);

// Responses (worker -> caller)

struct Ready {
    int pid = 0;
    std::string device;
    int ncpu = 0;
    int idle_seconds = 0;
    bool merge_cues = false;
    size_t max_words = 0;
};

struct ResultOk {
    nlohmann::json id;
    std::string srt_path;
};

struct ResultError {
    nlohmann::json id;
    std::string error;
    std::string traceback;
};

struct ShutdownAck {
    nlohmann::json id;
};

using Response = std::variant<Ready, ResultOk, ResultError, ShutdownAck>;

nlohmann::json to_json(const Response& response);

// True for lines holding nothing but whitespace.
bool is_blank(const std::string& line);

} // namespace protocol
