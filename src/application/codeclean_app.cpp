#include "codeclean/application/codeclean_app.hpp"
#include "codeclean/core/line_tools.hpp"
#include "codeclean/string_utils.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace codeclean {

CodeCleanApp::CodeCleanApp(std::unique_ptr<ITerminal> terminal,
                           std::unique_ptr<IFileSystem> filesystem)
    : terminal_(std::move(terminal)), filesystem_(std::move(filesystem)) {}

auto CodeCleanApp::run(const Config& config) -> int {
    bool all_read = true;
    auto inputs = load_inputs(config, all_read);
    if (inputs.empty()) {
        std::cout << "No files to process.\n";
        return all_read ? 0 : 1;
    }

    auto jobs = effective_jobs(config.jobs, inputs.size());
    spdlog::debug("processing {} file(s) on {} worker(s), comments={} blank_lines={} eol={}",
                  inputs.size(), jobs, config.options.remove_comments ? "remove" : "keep",
                  config.options.remove_extra_blank_lines ? "collapse" : "keep",
                  eol_target_name(config.options.eol_target));

    std::vector<CleanResult> results;
    for (auto& result : process_batch(inputs, config.options, jobs)) {
        if (result) {
            results.push_back(std::move(*result));
        }
    }

    for (const auto& result : results) {
        for (const auto& warning : result.warnings) {
            spdlog::warn("{}: {}", result.path, warning);
        }
    }

    show_summary(results);

    if (config.preview) {
        for (const auto& result : results) {
            if (result.changed()) {
                terminal_->display_screen(compose_preview_screen(result));
            }
        }
    }

    std::vector<CleanResult> changed;
    std::copy_if(results.begin(), results.end(), std::back_inserter(changed),
                 [](const CleanResult& r) { return r.changed(); });

    if (!config.write) {
        std::cout << "Dry run - no files modified. " << changed.size()
                  << " file(s) would change.\n";
        return all_read ? 0 : 1;
    }

    if (changed.empty()) {
        std::cout << "Nothing to write.\n";
        return all_read ? 0 : 1;
    }

    if (!confirm_write(changed.size(), config)) {
        std::cout << "Aborted - no files modified.\n";
        return all_read ? 0 : 1;
    }

    if (!write_results(changed)) {
        std::cerr << "Error: Failed to write some files\n";
        return 1;
    }

    std::cout << "Successfully wrote " << changed.size() << " file(s).\n";
    return all_read ? 0 : 1;
}

auto CodeCleanApp::load_inputs(const Config& config, bool& all_read) -> std::vector<FileInput> {
    std::vector<FileInput> inputs;

    for (const auto& path : config.files) {
        if (!filesystem_->file_exists(path)) {
            spdlog::error("{}: no such file", path);
            all_read = false;
            continue;
        }
        if (filesystem_->is_likely_binary(path)) {
            spdlog::warn("{}: looks like a binary file, skipped", path);
            continue;
        }

        auto text = filesystem_->read_text(path);
        if (!text) {
            spdlog::error("{}: cannot read file", path);
            all_read = false;
            continue;
        }
        inputs.push_back(FileInput{.path = path, .text = std::move(*text)});
    }

    return inputs;
}

auto CodeCleanApp::confirm_write(size_t changed_count, const Config& config) -> bool {
    if (config.assume_yes) {
        return true;
    }
    if (!terminal_->is_interactive()) {
        std::cerr << "Warning: No terminal to confirm on, use --yes to write without asking\n";
        return false;
    }

    std::cout << "Overwrite " << changed_count << " file(s)? [y/N] " << std::flush;
    auto answer = StringUtils::to_lowercase(StringUtils::trim(terminal_->read_line()));
    return answer == "y" || answer == "yes";
}

auto CodeCleanApp::write_results(const std::vector<CleanResult>& results) -> bool {
    bool all_success = true;
    for (const auto& result : results) {
        try {
            if (!filesystem_->write_text_atomic(result.cleaned, result.path)) {
                spdlog::error("{}: write failed", result.path);
                all_success = false;
            }
        } catch (const std::exception& e) {
            spdlog::error("{}: {}", result.path, e.what());
            all_success = false;
        }
    }
    return all_success;
}

auto CodeCleanApp::summary_line(const CleanResult& result) -> std::string {
    std::string marker = result.has_warnings() ? "!" : (result.changed() ? "M" : "=");
    std::string line = marker + " " + result.path;
    line += " [" + (result.language.empty() ? std::string("unknown") : result.language) + "]";

    if (result.changed()) {
        size_t removed = 0;
        size_t added = 0;
        for (const auto& range : result.changes) {
            if (range.kind == DiffKind::REMOVED) {
                removed += range.size();
            } else if (range.kind == DiffKind::ADDED) {
                added += range.size();
            }
        }
        line += " -" + std::to_string(removed) + " +" + std::to_string(added) + " lines";
        if (removed == 0 && added == 0) {
            line += " (line endings)";
        }
    }
    if (result.structurally_reformatted) {
        line += " (reformatted)";
    }
    return line;
}

auto CodeCleanApp::show_summary(const std::vector<CleanResult>& results) -> void {
    size_t changed_count = 0;
    for (const auto& result : results) {
        std::cout << summary_line(result) << '\n';
        if (result.changed()) {
            ++changed_count;
        }
    }
    std::cout << changed_count << " of " << results.size() << " file(s) changed.\n";
}

auto CodeCleanApp::compose_preview_screen(const CleanResult& result) -> Screen {
    Screen screen;
    screen.content.push_back(Line{.text = "--- " + result.path, .style = LineStyle::HEADER});
    screen.content.push_back(Line{.text = "+++ " + result.path, .style = LineStyle::HEADER});

    auto original = split_lines(result.original);
    auto cleaned = split_lines(result.cleaned);

    for (const auto& range : result.changes) {
        switch (range.kind) {
        case DiffKind::UNCHANGED:
            // Context is elided; only the position is shown
            screen.content.push_back(Line{.text = "@@ " + std::to_string(range.size())
                                                  + " unchanged line(s) from "
                                                  + std::to_string(range.start + 1) + " @@",
                                          .style = LineStyle::HEADER});
            break;
        case DiffKind::REMOVED:
            for (size_t i = range.start; i < range.end && i < original.size(); ++i) {
                screen.content.push_back(Line{.text = original[i], .style = LineStyle::REMOVED});
            }
            break;
        case DiffKind::ADDED:
            for (size_t i = range.start; i < range.end && i < cleaned.size(); ++i) {
                screen.content.push_back(Line{.text = cleaned[i], .style = LineStyle::ADDED});
            }
            break;
        }
    }

    screen.status_line = summary_line(result);
    return screen;
}

} // namespace codeclean
