#include "coedit/lsp/document_mirror.hpp"
#include "coedit/error.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace coedit::lsp {

DocumentMirror::DocumentMirror(std::filesystem::path path) : path_(std::move(path)) {}

void DocumentMirror::write(const std::string& text) const {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw MirrorWriteError("Cannot open " + path_.string() + ": " + std::strerror(errno));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        throw MirrorWriteError("Failed writing " + std::to_string(text.size()) + " bytes to " + path_.string());
    }
}

} // namespace coedit::lsp
