#include "subtitle/cue_extractor.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>

namespace subtitle {

int64_t time_field(const nlohmann::json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) return 0;

    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number_float()) return static_cast<int64_t>(std::trunc(it->get<double>()));
    if (it->is_boolean()) return it->get<bool>() ? 1 : 0;

    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec == std::errc() && ptr == s.data() + s.size()) return value;
    }

    throw std::invalid_argument(std::string("sentence record has a non-integer '") + key +
                                "': " + it->dump());
}

CueSequence extract_cues(const nlohmann::json& raw) {
    CueSequence cues;
    for_each_sentence(raw, [&cues](const nlohmann::json& record) {
        auto text = record.find("text");
        cues.push_back(Cue{
            .start = time_field(record, "start"),
            .end = time_field(record, "end"),
            .text = (text != record.end() && text->is_string()) ? text->get<std::string>() : "",
        });
    });
    return cues;
}

} // namespace subtitle
