#pragma once

#include "subtitle/cue.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>

namespace subtitle {

// One cue per sentence record of every item carrying "sentence_info".
// `raw` is either one item or an array of items, in engine order.
// Throws std::invalid_argument when a start/end value is not a number.
CueSequence extract_cues(const nlohmann::json& raw);

// Millisecond field of a sentence record; 0 when absent or null.
int64_t time_field(const nlohmann::json& record, const char* key);

// Calls fn(record) for each sentence record, skipping items without "sentence_info".
template <typename Fn>
void for_each_sentence(const nlohmann::json& raw, Fn&& fn) {
    auto visit_item = [&fn](const nlohmann::json& item) {
        if (!item.is_object()) return;
        auto it = item.find("sentence_info");
        if (it == item.end() || !it->is_array()) return;
        for (const auto& record : *it) {
            if (record.is_object()) fn(record);
        }
    };

    if (raw.is_array()) {
        for (const auto& item : raw) visit_item(item);
    } else {
        visit_item(raw);
    }
}

} // namespace subtitle
