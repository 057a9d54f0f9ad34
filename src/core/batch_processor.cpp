#include "codeclean/core/batch_processor.hpp"
#include "codeclean/core/line_diff.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>

namespace codeclean {

auto effective_jobs(size_t requested, size_t file_count) -> size_t {
    size_t jobs = requested;
    if (jobs == 0) {
        jobs = std::max<size_t>(std::thread::hardware_concurrency(), 1);
    }
    return std::max<size_t>(std::min(jobs, file_count), 1);
}

namespace {

// The file is reported untouched so nothing gets written for it
auto failed_result(const FileInput& input, const std::string& reason) -> CleanResult {
    return CleanResult{.path = input.path,
                       .original = input.text,
                       .cleaned = input.text,
                       .changes = diff_lines(input.text, input.text),
                       .warnings = {"processing failed: " + reason}};
}

} // namespace

auto process_batch(const std::vector<FileInput>& inputs, const Options& options, size_t jobs,
                   std::stop_token stop) -> std::vector<std::optional<CleanResult>> {
    return process_batch(inputs, options, jobs, process, std::move(stop));
}

auto process_batch(const std::vector<FileInput>& inputs, const Options& options, size_t jobs,
                   const FileProcessor& processor, std::stop_token stop)
    -> std::vector<std::optional<CleanResult>> {
    std::vector<std::optional<CleanResult>> results(inputs.size());
    if (inputs.empty()) {
        return results;
    }

    // Each slot of `results` is written by exactly one worker
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        while (!stop.stop_requested()) {
            size_t index = next_index.fetch_add(1);
            if (index >= inputs.size()) {
                return;
            }
            const auto& input = inputs[index];
            spdlog::debug("Processing {}", input.path);
            try {
                results[index] = processor(input.path, input.text, options);
            } catch (const std::exception& e) {
                spdlog::error("{}: {}", input.path, e.what());
                results[index] = failed_result(input, e.what());
            }
        }
    };

    size_t worker_count = effective_jobs(jobs, inputs.size());

    if (worker_count == 1) {
        worker();
        return results;
    }

    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
    } // Joined here

    return results;
}

} // namespace codeclean
