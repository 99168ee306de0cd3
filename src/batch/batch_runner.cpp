#include "batch_runner.hpp"

#include "logging.hpp"
#include "recognition.hpp"
#include "wav.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace batch {

namespace {

bool is_wav(const fs::path& p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".wav";
}

bool transcribe(Recognizer& recognizer, const fs::path& input, const fs::path& out_dir) {
    auto audio = wav::read_file(input.string());
    if (!audio) {
        logging::error("failed to load {}: {}", input.string(), audio.error());
        return false;
    }

    double duration = audio->sample_rate > 0
        ? static_cast<double>(audio->samples.size()) / audio->sample_rate
        : 0.0;
    logging::info("sample rate {} Hz, {} channel(s), {:.2f}s",
                  audio->sample_rate, audio->channels, duration);

    auto raw = recognizer.recognize(audio->samples, audio->sample_rate);
    if (!raw) {
        logging::error("recognition failed for {}: {}", input.string(), raw.error());
        return false;
    }

    auto result = map_recognizer_output(*raw);
    if (result.error) {
        logging::error("recognition failed for {}: {}", input.string(), *result.error);
        return false;
    }
    logging::info("text: {}", result.text);

    json out = {
        {"filename", input.filename().string()},
        {"text", result.text},
        {"timestamps", json::array()},
    };
    for (auto& s : result.segments) {
        out["timestamps"].push_back({{"text", s.text}, {"start", s.start}, {"end", s.end}});
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        logging::error("cannot create {}: {}", out_dir.string(), ec.message());
        return false;
    }

    auto out_path = out_dir / (input.stem().string() + "_result.json");
    std::ofstream f(out_path);
    if (!f.is_open()) {
        logging::error("cannot write {}", out_path.string());
        return false;
    }
    f << out.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    if (!f) {
        logging::error("write to {} failed", out_path.string());
        return false;
    }
    logging::info("saved {}", out_path.string());
    return true;
}

} // namespace

std::vector<fs::path> collect_inputs(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && is_wav(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) logging::warn("error walking {}: {}", dir.string(), ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

bool process_file(Recognizer& recognizer, const fs::path& input, const fs::path& out_dir) {
    logging::info("processing {}", input.string());
    try {
        return transcribe(recognizer, input, out_dir);
    } catch (const std::exception& e) {
        logging::error("processing {} failed: {}", input.string(), e.what());
        return false;
    }
}

} // namespace batch
