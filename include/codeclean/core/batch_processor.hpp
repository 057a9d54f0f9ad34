#pragma once

#include "codeclean/core/pipeline.hpp"
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace codeclean {

struct FileInput {
    std::string path;
    std::string text;                  // Already decoded
};

using FileProcessor =
    std::function<CleanResult(const std::string& path, const std::string& text, const Options&)>;

// Runs process() over `inputs` on up to `jobs` worker threads (0 = hardware concurrency).
// Results are in input order. After a stop request no further file is started; files
// that never started stay std::nullopt, files in progress run to completion.
auto process_batch(const std::vector<FileInput>& inputs, const Options& options, size_t jobs,
                   std::stop_token stop = {}) -> std::vector<std::optional<CleanResult>>;

// Same, with a custom per-file step. A file whose step throws keeps its original text
// and gets a "processing failed" warning; the other files are unaffected.
auto process_batch(const std::vector<FileInput>& inputs, const Options& options, size_t jobs,
                   const FileProcessor& processor, std::stop_token stop = {})
    -> std::vector<std::optional<CleanResult>>;

auto effective_jobs(size_t requested, size_t file_count) -> size_t;

} // namespace codeclean
