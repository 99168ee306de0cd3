#include <catch2/catch_test_macros.hpp>

#include "recognition.hpp"
#include "recognizer/lan_recognizer.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

TEST_CASE("LAN recognizer response", "[recognizer]") {

    SECTION("VerboseJsonSegments") {
        auto r = LanRecognizer::normalize_response(R"({
            "text": "  hello world \n",
            "segments": [
                {"id": 0, "start": 0.0, "end": 0.48, "text": " hello"},
                {"id": 1, "start": 0.48, "end": 1.2, "text": " world"}
            ]
        })");
        REQUIRE(r.has_value());
        REQUIRE((*r)["text"] == "hello world");
        REQUIRE((*r)["timestamp"].size() == 2);
        REQUIRE((*r)["timestamp"][0]["text"] == "hello");
        REQUIRE((*r)["timestamp"][1]["timestamp"][0] == 480);
        REQUIRE((*r)["timestamp"][1]["timestamp"][1] == 1200);

        // Feeds straight into result mapping.
        auto mapped = map_recognizer_output(*r);
        REQUIRE(mapped.text == "hello world");
        REQUIRE(mapped.segments.size() == 2);
        REQUIRE(mapped.segments[1].end == 1200);
    }

    SECTION("PlainTextResponse") {
        auto r = LanRecognizer::normalize_response(R"({"text": "ok"})");
        REQUIRE(r.has_value());
        REQUIRE((*r)["text"] == "ok");
        REQUIRE_FALSE(r->contains("timestamp"));
    }

    SECTION("SegmentsWithoutTimesSkipped") {
        auto r = LanRecognizer::normalize_response(
            R"({"text": "a", "segments": [{"text": "a"}, {"start": "x", "end": 1}]})");
        REQUIRE(r.has_value());
        REQUIRE((*r)["timestamp"].empty());
    }

    SECTION("NonStringSegmentTextSkipped") {
        auto r = LanRecognizer::normalize_response(
            R"({"text": "a b", "segments": [{"start": 0, "end": 1, "text": 5},
                                            {"start": 1, "end": 2, "text": " b"}]})");
        REQUIRE(r.has_value());
        REQUIRE((*r)["timestamp"].size() == 1);
        REQUIRE((*r)["timestamp"][0]["text"] == "b");
    }

    SECTION("InvalidUtf8DoesNotThrowWhileLogging") {
        json bad = json::array({std::string("\xff\xfe")});
        protocol::RecognitionResult mapped;
        REQUIRE_NOTHROW(mapped = map_recognizer_output(bad));
        REQUIRE(mapped.error == "unexpected result shape");
    }

    SECTION("ErrorBody") {
        auto r = LanRecognizer::normalize_response(R"({"error": "model not loaded"})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "server error: model not loaded");

        auto openai = LanRecognizer::normalize_response(
            R"({"error": {"message": "bad file", "type": "invalid_request_error"}})");
        REQUIRE_FALSE(openai.has_value());
        REQUIRE(openai.error() == "server error: bad file");
    }

    SECTION("NotJson") {
        auto r = LanRecognizer::normalize_response("<html>502 Bad Gateway</html>");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().starts_with("JSON parse error"));
    }

    SECTION("MissingText") {
        auto r = LanRecognizer::normalize_response(R"({"language": "en"})");
        REQUIRE_FALSE(r.has_value());
    }

    SECTION("NonRecordPassedThroughForShapeCheck") {
        auto r = LanRecognizer::normalize_response("[1, 2, 3]");
        REQUIRE(r.has_value());
        REQUIRE(r->is_array());
        REQUIRE(map_recognizer_output(*r).error == "unexpected result shape");

        auto numeric = LanRecognizer::normalize_response(R"({"text": 5})");
        REQUIRE(numeric.has_value());
        REQUIRE(map_recognizer_output(*numeric).error == "unexpected result shape");
    }

    SECTION("EmptyAudioRejectedWithoutRequest") {
        LanRecognizer recognizer("http://127.0.0.1:9");
        std::vector<float> empty;
        auto r = recognizer.recognize(empty, 16000);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "empty audio");
    }
}
