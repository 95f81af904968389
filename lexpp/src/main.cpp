#include "lexpp/Diagnostic.h"
#include "lexpp/Driver.h"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>

// ── CLI options ───────────────────────────────────────────────────────────────
static llvm::cl::list<std::string>
    InputFiles(llvm::cl::Positional, llvm::cl::desc("<input files>"),
               llvm::cl::ZeroOrMore);

static llvm::cl::opt<std::string>
    OutputFile("o", llvm::cl::desc("Output file"),
               llvm::cl::value_desc("filename"), llvm::cl::init("-"));

static llvm::cl::opt<bool>
    NoLineMarkers("no-line-markers",
        llvm::cl::desc("Do not emit '# N \"file\"' line markers"));

static llvm::cl::alias
    NoLineMarkersShort("n", llvm::cl::desc("Alias for --no-line-markers"),
                       llvm::cl::aliasopt(NoLineMarkers));

static llvm::cl::opt<bool>
    Verbose("v", llvm::cl::desc("Verbose output"));

// -I <dir> include paths
static llvm::cl::list<std::string>
    IncludePaths("I", llvm::cl::desc("Add include search directory"),
                 llvm::cl::value_desc("dir"), llvm::cl::Prefix);

// -D NAME[=VALUE] command-line defines
static llvm::cl::list<std::string>
    CmdlineDefs("D", llvm::cl::desc("Define macro"),
                llvm::cl::value_desc("NAME[=VALUE]"), llvm::cl::Prefix);

// -U NAME
static llvm::cl::list<std::string>
    CmdlineUndefs("U", llvm::cl::desc("Undefine macro"),
                  llvm::cl::value_desc("NAME"), llvm::cl::Prefix);

int main(int argc, char **argv) {
    llvm::InitLLVM X(argc, argv);

    llvm::cl::ParseCommandLineOptions(argc, argv, "lexpp macro preprocessor\n");

    // ── 1. Collect options ────────────────────────────────────────────────────
    lexpp::DriverOptions opts;
    opts.inputs.assign(InputFiles.begin(), InputFiles.end());
    opts.outputFile = OutputFile;
    opts.defines.assign(CmdlineDefs.begin(), CmdlineDefs.end());
    opts.undefines.assign(CmdlineUndefs.begin(), CmdlineUndefs.end());
    opts.includeDirs.assign(IncludePaths.begin(), IncludePaths.end());
    opts.expand.lineMarkers = !NoLineMarkers;
    opts.verbose = Verbose;

    // ── 2. Expand ─────────────────────────────────────────────────────────────
    lexpp::DiagEngine diag;
    std::string       out;
    if (!lexpp::preprocess(opts, diag, out)) {
        fprintf(stderr, "Preprocessing failed with %d error(s)\n", diag.errorCount());
        return 1;
    }

    // ── 3. Write output ───────────────────────────────────────────────────────
    if (opts.outputFile == "-") {
        llvm::outs() << out;
        llvm::outs().flush();
        return 0;
    }

    std::error_code EC;
    llvm::raw_fd_ostream os(opts.outputFile, EC, llvm::sys::fs::OF_Text);
    if (EC) {
        fprintf(stderr, "error: cannot open output file '%s': %s\n",
                opts.outputFile.c_str(), EC.message().c_str());
        return 1;
    }
    os << out;
    os.close();
    if (os.has_error()) {
        fprintf(stderr, "error: cannot write output file '%s': %s\n",
                opts.outputFile.c_str(), os.error().message().c_str());
        os.clear_error();
        return 1;
    }
    if (Verbose) fprintf(stderr, "[lexpp] Wrote %s\n", opts.outputFile.c_str());
    return 0;
}
