#pragma once

#include <filesystem>
#include <string>

namespace coedit::lsp {

/**
 * On-disk copy of the document the analysis process reads.
 * Every write replaces the whole file; the last writer wins.
 */
class DocumentMirror {
public:
    explicit DocumentMirror(std::filesystem::path path);

    // Throws MirrorWriteError on any I/O failure.
    void write(const std::string& text) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace coedit::lsp
