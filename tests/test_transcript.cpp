#include <catch2/catch_test_macros.hpp>

#include "transcript.hpp"

#include <string>
#include <thread>

TEST_CASE("Transcript aggregator", "[transcript]") {
    TranscriptAggregator agg;

    SECTION("StartsEmpty") {
        auto snap = agg.snapshot();
        REQUIRE(snap.current_text.empty());
        REQUIRE(snap.accumulated_text.empty());
        REQUIRE_FALSE(snap.session_seconds.has_value());
    }

    SECTION("AppendsWithSpaces") {
        REQUIRE(agg.on_result("good"));
        REQUIRE(agg.on_result("morning"));
        REQUIRE(agg.accumulated_text() == "good morning");
        REQUIRE(agg.current_text() == "morning");
    }

    SECTION("OverlappingPartials") {
        REQUIRE(agg.on_result("hello"));
        REQUIRE(agg.on_result("hello world"));
        REQUIRE(agg.accumulated_text().ends_with("hello world"));
        REQUIRE(agg.accumulated_text() == "hello hello world");

        REQUIRE_FALSE(agg.on_result("world"));
        REQUIRE(agg.accumulated_text() == "hello hello world");
        REQUIRE(agg.current_text() == "world");
    }

    SECTION("RepeatIsIdempotent") {
        agg.on_result("same text");
        auto before = agg.accumulated_text();
        REQUIRE_FALSE(agg.on_result("same text"));
        REQUIRE(agg.accumulated_text() == before);
    }

    SECTION("EmptyResultChangesNothing") {
        agg.on_result("kept");
        REQUIRE_FALSE(agg.on_result(""));
        REQUIRE(agg.current_text() == "kept");
        REQUIRE(agg.accumulated_text() == "kept");
    }

    SECTION("RecurringPhraseIsDropped") {
        agg.on_result("yes");
        agg.on_result("no");
        REQUIRE_FALSE(agg.on_result("yes"));
        REQUIRE(agg.accumulated_text() == "yes no");
    }

    SECTION("ResetClearsAndStartsClock") {
        agg.on_result("old");
        agg.reset();
        REQUIRE(agg.current_text().empty());
        REQUIRE(agg.accumulated_text().empty());
        REQUIRE(agg.session_start().has_value());

        auto snap = agg.snapshot();
        REQUIRE(snap.session_seconds.has_value());
        REQUIRE(*snap.session_seconds >= 0.0);

        REQUIRE(agg.on_result("old"));
        REQUIRE(agg.accumulated_text() == "old");
    }

    SECTION("ConcurrentResultsAndReads") {
        std::jthread writer([&agg] {
            for (int i = 0; i < 200; i++) agg.on_result("w" + std::to_string(i) + ";");
        });
        for (int i = 0; i < 200; i++) (void)agg.snapshot();
        writer.join();
        REQUIRE(agg.current_text() == "w199;");
    }
}
