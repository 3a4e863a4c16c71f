#include <catch2/catch_test_macros.hpp>

#include "subtitle/cue_splitter.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace subtitle;

TEST_CASE("Cue splitting", "[split]") {

    SECTION("NoTimestampsGivesOneCue") {
        auto raw = json::parse(R"({"sentence_info": [{"text": "plain", "start": 10, "end": 20}]})");
        auto cues = split_cues(raw, 2);
        REQUIRE(cues.size() == 1);
        REQUIRE(cues[0] == Cue{10, 20, "plain"});
    }

    SECTION("MismatchedTimestampsFallBack") {
        auto raw = json::parse(R"({"sentence_info": [
            {"text": "abc", "start": 0, "end": 300, "timestamp": [[0, 100], [100, 200]]}
        ]})");
        auto cues = split_cues(raw, 1);
        REQUIRE(cues.size() == 1);
        REQUIRE(cues[0] == Cue{0, 300, "abc"});
    }

    SECTION("CutAtPunctuationOnceLong") {
        auto raw = json::parse(R"({"sentence_info": [{
            "text": "你好，世界。",
            "start": 0, "end": 600,
            "timestamp": [[0,100],[100,200],[200,300],[300,400],[400,500],[500,600]]
        }]})");

        auto cues = split_cues(raw, 2);
        REQUIRE(cues.size() == 2);
        REQUIRE(cues[0] == Cue{0, 300, "你好，"});
        REQUIRE(cues[1] == Cue{300, 600, "世界。"});
    }

    SECTION("ShortSentenceStaysWhole") {
        auto raw = json::parse(R"({"sentence_info": [{
            "text": "你好，世界。",
            "start": 0, "end": 600,
            "timestamp": [[10,100],[100,200],[200,300],[300,400],[400,500],[500,590]]
        }]})");

        auto cues = split_cues(raw);
        REQUIRE(cues.size() == 1);
        REQUIRE(cues[0] == Cue{10, 590, "你好，世界。"});
    }

    SECTION("CutAtSpaceOnceLong") {
        auto raw = json::parse(R"({"sentence_info": [{
            "text": "ab cd",
            "start": 0, "end": 500,
            "timestamp": [[0,100],[100,200],[200,250],[250,300],[300,500]]
        }]})");

        // "ab " reaches the limit holding a space; the space is stripped.
        auto cues = split_cues(raw, 3);
        REQUIRE(cues.size() == 2);
        REQUIRE(cues[0] == Cue{0, 250, "ab"});
        REQUIRE(cues[1] == Cue{250, 500, "cd"});
    }

    SECTION("BlankChunksDropped") {
        auto raw = json::parse(R"({"sentence_info": [{
            "text": "a,  ",
            "start": 0, "end": 400,
            "timestamp": [[0,100],[100,200],[200,300],[300,400]]
        }]})");

        auto cues = split_cues(raw, 2);
        REQUIRE(cues.size() == 1);
        REQUIRE(cues[0] == Cue{0, 200, "a,"});
    }
}
