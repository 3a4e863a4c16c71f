#pragma once

#include "subtitle/cue.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>

namespace subtitle {

constexpr size_t DEFAULT_MAX_CHARS_PER_LINE = 40;

// Like extract_cues, but a sentence record whose "timestamp" array has one
// [start, end] pair per character is cut into shorter cues. A cut happens at
// the last character, or once the chunk reaches max_chars and either the
// current character is punctuation or the chunk already contains a space.
// Records without usable per-character timestamps yield one cue each.
CueSequence split_cues(const nlohmann::json& raw, size_t max_chars = DEFAULT_MAX_CHARS_PER_LINE);

} // namespace subtitle
