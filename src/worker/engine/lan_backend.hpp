#pragma once

#include "backend.hpp"

#include <string>

class LanBackend : public RecognitionBackend {
public:
    // api_format: "funasr" or "whisper.cpp"
    LanBackend(std::string url, std::string api_format = "funasr", long timeout_s = 600);
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    bool load() override;

    std::expected<nlohmann::json, std::string>
        recognize(const std::string& audio_path, const RecognitionParams& params) override;

    std::string name() const override { return "lan:" + api_format_; }

    // Brings a server response into the sentence_info shape.
    static std::expected<nlohmann::json, std::string>
        normalize_response(const nlohmann::json& body, const std::string& api_format);

private:
    std::string url_;
    std::string api_format_;
    long timeout_s_;
    bool curl_ready_ = false;
};
