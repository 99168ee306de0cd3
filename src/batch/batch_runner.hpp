#pragma once

#include "recognizer/recognizer.hpp"

#include <filesystem>
#include <vector>

// Offline transcription of WAV files through a Recognizer.
namespace batch {

// .wav files (case-insensitive) under dir, recursively, sorted by path.
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& dir);

// Transcribes one file and writes <out_dir>/<stem>_result.json. Failures of
// any kind are logged and reported as false; nothing is thrown.
bool process_file(Recognizer& recognizer, const std::filesystem::path& input,
                  const std::filesystem::path& out_dir);

} // namespace batch
