#include <catch2/catch_test_macros.hpp>

#include "subtitle/cue_extractor.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;
using namespace subtitle;

TEST_CASE("Cue extraction", "[extract]") {

    SECTION("NoSentenceInfo") {
        REQUIRE(extract_cues(json{{"text", "hello"}}).empty());
        REQUIRE(extract_cues(json::array()).empty());
        REQUIRE(extract_cues(json(nullptr)).empty());
    }

    SECTION("SingleItem") {
        auto raw = json::parse(R"({
            "key": "a",
            "text": "Hello, world.",
            "sentence_info": [
                {"text": "Hello,", "start": 0, "end": 1000},
                {"text": "world.", "start": 1000, "end": 2000}
            ]
        })");

        auto cues = extract_cues(raw);
        REQUIRE(cues.size() == 2);
        REQUIRE(cues[0] == Cue{0, 1000, "Hello,"});
        REQUIRE(cues[1] == Cue{1000, 2000, "world."});
    }

    SECTION("ListAndSingleAgree") {
        auto item = json::parse(R"({"sentence_info": [{"text": "x", "start": 5, "end": 9}]})");
        REQUIRE(extract_cues(item) == extract_cues(json::array({item})));
    }

    SECTION("ItemsConcatenatedInOrder") {
        auto raw = json::parse(R"([
            {"sentence_info": [{"text": "a", "start": 0, "end": 1}]},
            {"text": "no sentences here"},
            {"sentence_info": [{"text": "b", "start": 2, "end": 3},
                               {"text": "c", "start": 3, "end": 4}]}
        ])");

        auto cues = extract_cues(raw);
        REQUIRE(cues.size() == 3);
        REQUIRE(cues[0].text == "a");
        REQUIRE(cues[1].text == "b");
        REQUIRE(cues[2].text == "c");
    }

    SECTION("MissingFieldsDefault") {
        auto raw = json::parse(R"({"sentence_info": [{"start": 100}, {"text": "t", "end": null}]})");

        auto cues = extract_cues(raw);
        REQUIRE(cues.size() == 2);
        REQUIRE(cues[0] == Cue{100, 0, ""});
        REQUIRE(cues[1] == Cue{0, 0, "t"});
    }

    SECTION("NonArraySentenceInfoIgnored") {
        REQUIRE(extract_cues(json{{"sentence_info", "oops"}}).empty());
    }

    SECTION("NumericCoercion") {
        auto raw = json::parse(R"({"sentence_info": [
            {"text": "f", "start": 1.9, "end": 2500.2},
            {"text": "s", "start": "42", "end": "43"}
        ]})");

        auto cues = extract_cues(raw);
        REQUIRE(cues[0].start == 1);
        REQUIRE(cues[0].end == 2500);
        REQUIRE(cues[1].start == 42);
        REQUIRE(cues[1].end == 43);
    }

    SECTION("NonNumericTimeThrows") {
        auto raw = json::parse(R"({"sentence_info": [{"text": "x", "start": "soon", "end": 1}]})");
        REQUIRE_THROWS_AS(extract_cues(raw), std::invalid_argument);

        auto obj = json::parse(R"({"sentence_info": [{"text": "x", "start": {}, "end": 1}]})");
        REQUIRE_THROWS_AS(extract_cues(obj), std::invalid_argument);
    }
}
