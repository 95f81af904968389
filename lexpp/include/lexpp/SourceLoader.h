#pragma once
#include "lexpp/AST.h"
#include "lexpp/Diagnostic.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexpp {

// ── SourceLoader ──────────────────────────────────────────────────────────────
// Supplies the parsed contents of an #include target. `from` is the location
// of the directive; relative lookups start from its file.
//
// An include is handled in three steps: locate() picks the source the
// directive names, identify() gives the key that source has in the inclusion
// ancestry, and load() parses it.
class SourceLoader {
public:
    virtual ~SourceLoader() = default;

    virtual std::string locate(const std::string &path, const SourceLocation &from) = 0;

    // Two spellings of one source must give the same key.
    virtual std::string identify(const std::string &located) const { return located; }

    virtual NodeList load(const std::string &located, const SourceLocation &from) = 0;
};

// Reads targets from disk. A relative target is looked up in the including
// file's directory, then as written (relative to the working directory), then
// in each include directory in order. The parsed nodes carry the located path,
// so nested lookups start from the right directory. Sources are identified by
// their real path.
class FileSourceLoader : public SourceLoader {
public:
    explicit FileSourceLoader(std::vector<std::string> includeDirs = {});

    // Throws an Io PreprocError when no candidate exists.
    std::string locate(const std::string &path, const SourceLocation &from) override;
    // Names that are not files ("<stdin>", "<command line>") are their own key.
    std::string identify(const std::string &located) const override;
    NodeList    load(const std::string &located, const SourceLocation &from) override;

    // Empty when no candidate exists.
    std::string resolve(const std::string &path, const std::string &fromFile) const;

    const std::vector<std::string> &includeDirs() const { return includeDirs_; }

private:
    std::vector<std::string> includeDirs_;
};

// Serves sources from memory, keyed by the path as written.
class MemorySourceLoader : public SourceLoader {
public:
    void add(std::string path, std::string contents) {
        files_[std::move(path)] = std::move(contents);
    }

    // Every name locates to itself; a missing one fails in load().
    std::string locate(const std::string &path, const SourceLocation &) override {
        return path;
    }
    NodeList load(const std::string &path, const SourceLocation &from) override;

    // Number of successful loads, per path.
    unsigned loadCount(const std::string &path) const {
        auto it = loads_.find(path);
        return (it != loads_.end()) ? it->second : 0;
    }

private:
    std::map<std::string, std::string> files_;
    std::map<std::string, unsigned>    loads_;
};

// Whole-file reads. Both throw an Io PreprocError naming `what` on failure.
std::string readSourceFile(const std::string &path, const std::string &what,
                           const std::optional<SourceLocation> &from = std::nullopt);
std::string readStdin();

} // namespace lexpp
