// errorsmith - instrument `if err != nil` / `if err == nil` guards in a Go file
#include "errorsmith/diagnostics_json.hpp"
#include "errorsmith/env.hpp"
#include "errorsmith/errorsmith.hpp"
#include "errorsmith/template.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/ToolOutputFile.h>
#include <llvm/Support/raw_ostream.h>
#include <stdexcept>
#include <string>

using namespace llvm;

static cl::OptionCategory ToolCategory("errorsmith options");

static cl::opt<std::string> InputFile(cl::Positional, cl::desc("<file.go>"), cl::init(""), cl::cat(ToolCategory));
static cl::opt<std::string> OutputFile("o", cl::desc("Output file (default: stdout)"), cl::value_desc("path"), cl::init("-"), cl::cat(ToolCategory));
static cl::opt<double> ErrorPercent("error-percent", cl::desc("Chance, in percent, that an injected error fires"), cl::value_desc("p"), cl::init(5.0), cl::cat(ToolCategory));
static cl::opt<bool> Trace("trace", cl::desc("Print a line to stdout whenever an injected error fires"), cl::init(true), cl::cat(ToolCategory));

static void print_usage(){
    errs() << "Usage of 'errorsmith':\n"
           << "  errorsmith [-o <path>] [-error-percent <p>] [-trace=<bool>] <file.go>\n"
           << "Options:\n"
           << "  -o <path>             output file (default: stdout)\n"
           << "  -error-percent <p>    chance, in percent, that an injected error fires (default: 5)\n"
           << "  -trace=<bool>         print a line whenever an injected error fires (default: true)\n";
}

int main(int argc, char** argv){
    cl::HideUnrelatedOptions(ToolCategory);
    cl::ParseCommandLineOptions(argc, argv, "errorsmith: probabilistic error injection for Go sources\n");

    if(InputFile.empty()){ print_usage(); return 2; }
    try {
        (void)errorsmith::make_denominator(ErrorPercent);
    } catch (const std::invalid_argument& e) {
        errs() << "errorsmith: " << e.what() << "\n";
        return 2;
    }

    const errorsmith::Env env = errorsmith::detect_env();

    auto buf = MemoryBuffer::getFileOrSTDIN(InputFile);
    if(std::error_code ec = buf.getError()){
        errs() << "errorsmith: " << InputFile << ": " << ec.message() << "\n";
        return 1;
    }

    errorsmith::InjectOptions opts;
    opts.error_percent = ErrorPercent;
    opts.trace = Trace;
    opts.log_sites = env.trace_sites;
    auto res = errorsmith::inject_errors(InputFile, (*buf)->getBuffer(), opts);
    errorsmith::maybe_print_json(res, env);

    switch(res.kind){
        case errorsmith::ErrorKind::none:
        case errorsmith::ErrorKind::format_error:
            break;
        case errorsmith::ErrorKind::parse_error:
            errs() << "errorsmith: " << InputFile << ":" << res.line << ":" << res.column << ": " << res.error_message << "\n";
            return 1;
        case errorsmith::ErrorKind::structural_error:
        case errorsmith::ErrorKind::config_error:
            errs() << "errorsmith: " << InputFile << ": " << res.error_message << "\n";
            return 1;
    }

    std::error_code ec;
    ToolOutputFile out(OutputFile, ec, sys::fs::OF_None);
    if(ec){
        errs() << "errorsmith: " << ec.message() << "\n";
        return 1;
    }
    out.os() << res.output;
    out.os().flush();
    if(out.os().has_error()){
        errs() << "errorsmith: " << OutputFile << ": " << out.os().error().message() << "\n";
        out.os().clear_error();
        return 1;
    }
    out.keep();

    if(res.kind == errorsmith::ErrorKind::format_error){
        errs() << "errorsmith: " << res.error_message << "\n";
        return 1;
    }
    return 0;
}
