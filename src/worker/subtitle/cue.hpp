#pragma once

#include <cstdint>
#include <string>
#include <vector>

// One subtitle entry. Times are milliseconds from the start of the audio.
struct Cue {
    int64_t start = 0;
    int64_t end = 0;
    std::string text;

    bool operator==(const Cue&) const = default;
};

using CueSequence = std::vector<Cue>;
