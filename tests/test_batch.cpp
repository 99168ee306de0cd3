#include <catch2/catch_test_macros.hpp>

#include "batch_runner.hpp"
#include "wav.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

class ScriptedRecognizer : public Recognizer {
public:
    enum class Mode { Segments, Fail, Throw, NotRecord };

    std::expected<json, std::string> recognize(std::span<const float> samples,
                                               uint32_t sample_rate) override {
        calls++;
        last_samples = samples.size();
        last_rate = sample_rate;
        switch (mode) {
        case Mode::Fail: return std::unexpected("server error: model not loaded");
        case Mode::Throw: throw std::runtime_error("type_error");
        case Mode::NotRecord: return json::array({1, 2});
        case Mode::Segments: break;
        }
        return json{
            {"text", "hello world"},
            {"timestamp", json::array({
                {{"text", "hello"}, {"timestamp", {0, 480}}},
                {{"text", "world"}, {"timestamp", {480, 1200}}},
            })},
        };
    }

    Mode mode = Mode::Segments;
    int calls = 0;
    size_t last_samples = 0;
    uint32_t last_rate = 0;
};

// Scratch directory removed with everything in it.
struct TmpDir {
    fs::path path;

    TmpDir() {
        std::string tmpl = (fs::temp_directory_path() / "asr_test_batch_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data())) path = buf.data();
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_bytes(const fs::path& p, const std::vector<uint8_t>& bytes) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void write_wav(const fs::path& p, size_t samples) {
    std::vector<float> audio(samples, 0.25f);
    write_bytes(p, wav::encode_float(audio, 16000));
}

} // namespace

TEST_CASE("Batch transcription", "[batch]") {
    TmpDir dir;
    REQUIRE_FALSE(dir.path.empty());
    auto out_dir = dir.path / "results";
    ScriptedRecognizer recognizer;

    SECTION("WritesResultJson") {
        auto input = dir.path / "meeting.wav";
        write_wav(input, 8000);

        REQUIRE(batch::process_file(recognizer, input, out_dir));
        REQUIRE(recognizer.last_samples == 8000);
        REQUIRE(recognizer.last_rate == 16000);

        std::ifstream f(out_dir / "meeting_result.json");
        REQUIRE(f.is_open());
        auto out = json::parse(f);
        REQUIRE(out["filename"] == "meeting.wav");
        REQUIRE(out["text"] == "hello world");
        REQUIRE(out["timestamps"].size() == 2);
        REQUIRE(out["timestamps"][1]["text"] == "world");
        REQUIRE(out["timestamps"][1]["start"] == 480);
        REQUIRE(out["timestamps"][1]["end"] == 1200);
    }

    SECTION("UndecodableInputFails") {
        auto input = dir.path / "broken.wav";
        write_bytes(input, {'n', 'o', 't', ' ', 'a', ' ', 'w', 'a', 'v'});

        REQUIRE_FALSE(batch::process_file(recognizer, input, out_dir));
        REQUIRE(recognizer.calls == 0);
        REQUIRE_FALSE(fs::exists(out_dir / "broken_result.json"));
    }

    SECTION("RecognizerErrorFails") {
        auto input = dir.path / "a.wav";
        write_wav(input, 1600);
        recognizer.mode = ScriptedRecognizer::Mode::Fail;

        REQUIRE_FALSE(batch::process_file(recognizer, input, out_dir));
        REQUIRE_FALSE(fs::exists(out_dir / "a_result.json"));
    }

    SECTION("NonRecordOutputFails") {
        auto input = dir.path / "a.wav";
        write_wav(input, 1600);
        recognizer.mode = ScriptedRecognizer::Mode::NotRecord;

        REQUIRE_FALSE(batch::process_file(recognizer, input, out_dir));
    }

    SECTION("ThrowingRecognizerDoesNotEscape") {
        auto first = dir.path / "first.wav";
        auto second = dir.path / "second.wav";
        write_wav(first, 1600);
        write_wav(second, 1600);

        recognizer.mode = ScriptedRecognizer::Mode::Throw;
        REQUIRE_FALSE(batch::process_file(recognizer, first, out_dir));

        // The run carries on with the next file.
        recognizer.mode = ScriptedRecognizer::Mode::Segments;
        REQUIRE(batch::process_file(recognizer, second, out_dir));
        REQUIRE(fs::exists(out_dir / "second_result.json"));
    }

    SECTION("CollectsWavFilesRecursively") {
        write_wav(dir.path / "b.wav", 16);
        write_wav(dir.path / "nested" / "a.WAV", 16);
        write_bytes(dir.path / "notes.txt", {'x'});

        auto files = batch::collect_inputs(dir.path);
        REQUIRE(files.size() == 2);
        REQUIRE(files[0] == dir.path / "b.wav");
        REQUIRE(files[1] == dir.path / "nested" / "a.WAV");
    }
}
