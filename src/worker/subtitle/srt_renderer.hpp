#pragma once

#include "subtitle/cue.hpp"

#include <cstdint>
#include <string>

namespace subtitle {

// HH:MM:SS,mmm. Negative input clamps to zero; hours widen past 99.
std::string format_timestamp(int64_t ms);

// Numbered SRT blocks separated by blank lines, ending in exactly one newline.
std::string render_srt(const CueSequence& cues);

} // namespace subtitle
