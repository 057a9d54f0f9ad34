#pragma once

#include "codeclean/application/config.hpp"
#include "codeclean/core/batch_processor.hpp"
#include "codeclean/interfaces.hpp"
#include "codeclean/ui/screen.hpp"
#include <memory>
#include <string>
#include <vector>

namespace codeclean {

class CodeCleanApp {
private:
    std::unique_ptr<ITerminal> terminal_;
    std::unique_ptr<IFileSystem> filesystem_;

public:
    CodeCleanApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem);

    // 0 on success, 1 when a file could not be read or written
    auto run(const Config& config) -> int;

    // Line-diff view of one result, built from its changed ranges
    static auto compose_preview_screen(const CleanResult& result) -> Screen;
    static auto summary_line(const CleanResult& result) -> std::string;

private:
    auto load_inputs(const Config& config, bool& all_read) -> std::vector<FileInput>;
    auto confirm_write(size_t changed_count, const Config& config) -> bool;
    auto write_results(const std::vector<CleanResult>& results) -> bool;
    auto show_summary(const std::vector<CleanResult>& results) -> void;
};

} // namespace codeclean
