#include "lexpp/SourceLoader.h"
#include "lexpp/Parser.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

namespace lexpp {

// =============================================================================
// Whole-file reads
// =============================================================================

std::string readSourceFile(const std::string &path, const std::string &what,
                           const std::optional<SourceLocation> &from) {
    auto mbOrErr = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!mbOrErr)
        throw PreprocError(ErrorKind::Io,
                           "Cannot open " + what + " " + quoteString(path) +
                           ": " + mbOrErr.getError().message(), from);
    return (*mbOrErr)->getBuffer().str();
}

std::string readStdin() {
    auto mbOrErr = llvm::MemoryBuffer::getSTDIN();
    if (!mbOrErr)
        throw PreprocError(ErrorKind::Io,
                           "Cannot read standard input: " + mbOrErr.getError().message());
    return (*mbOrErr)->getBuffer().str();
}

// =============================================================================
// FileSourceLoader
// =============================================================================

FileSourceLoader::FileSourceLoader(std::vector<std::string> includeDirs)
    : includeDirs_(std::move(includeDirs)) {}

std::string FileSourceLoader::resolve(const std::string &path,
                                      const std::string &fromFile) const {
    if (llvm::sys::path::is_absolute(path))
        return llvm::sys::fs::exists(path) ? path : std::string();

    // 1. Relative to the including file
    llvm::StringRef parent = llvm::sys::path::parent_path(fromFile);
    if (!parent.empty()) {
        llvm::SmallString<256> p(parent);
        llvm::sys::path::append(p, path);
        if (llvm::sys::fs::exists(p)) return p.str().str();
    }

    // 2. As written, relative to the working directory
    if (llvm::sys::fs::exists(path)) return path;

    // 3. Search include paths
    for (auto &dir : includeDirs_) {
        llvm::SmallString<256> p(dir);
        llvm::sys::path::append(p, path);
        if (llvm::sys::fs::exists(p)) return p.str().str();
    }
    return {};
}

std::string FileSourceLoader::locate(const std::string &path, const SourceLocation &from) {
    std::string resolved = resolve(path, from.start.file);
    if (resolved.empty())
        throw PreprocError(ErrorKind::Io,
                           "Cannot open included file " + quoteString(path) +
                           ": No such file or directory", from);
    return resolved;
}

std::string FileSourceLoader::identify(const std::string &located) const {
    llvm::SmallString<256> real;
    if (llvm::sys::fs::real_path(located, real)) return located;
    return real.str().str();
}

NodeList FileSourceLoader::load(const std::string &located, const SourceLocation &from) {
    std::string contents = readSourceFile(located, "included file", from);
    return parseSource(std::move(contents), located);
}

// =============================================================================
// MemorySourceLoader
// =============================================================================

NodeList MemorySourceLoader::load(const std::string &path, const SourceLocation &from) {
    auto it = files_.find(path);
    if (it == files_.end())
        throw PreprocError(ErrorKind::Io,
                           "Cannot open included file " + quoteString(path) +
                           ": No such file or directory", from);
    NodeList nodes = parseSource(it->second, path);
    ++loads_[path];
    return nodes;
}

} // namespace lexpp
