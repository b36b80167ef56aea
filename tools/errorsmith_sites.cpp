// errorsmith_sites - list the guards errorsmith would instrument, without rewriting anything
#include "errorsmith/edit_buffer.hpp"
#include "errorsmith/go/ast.hpp"
#include "errorsmith/go/parser.hpp"
#include "errorsmith/injector.hpp"
#include "errorsmith/source.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <string_view>

using namespace llvm;

static cl::OptionCategory ToolCategory("errorsmith_sites options");

static cl::opt<std::string> InputFile(cl::Positional, cl::desc("<file.go>"), cl::init(""), cl::cat(ToolCategory));
static cl::opt<bool> DumpTree("tree", cl::desc("Also print the statement tree the injector walks"), cl::init(false), cl::cat(ToolCategory));

// The guard's source line, without indentation and without the block it opens.
static std::string guard_text(const std::string& content, std::size_t at){
    std::size_t end = content.find('{', at);
    if(end == std::string::npos) end = content.size();
    std::string_view s(content.data() + at, end - at);
    while(!s.empty() && (s.back()==' ' || s.back()=='\t')) s.remove_suffix(1);
    return std::string(s);
}

int main(int argc, char** argv){
    cl::HideUnrelatedOptions(ToolCategory);
    cl::ParseCommandLineOptions(argc, argv, "errorsmith_sites: list injection sites in a Go source file\n");
    if(InputFile.empty()){
        errs() << "usage: errorsmith_sites [-tree] <file.go>\n";
        return 2;
    }

    auto buf = MemoryBuffer::getFileOrSTDIN(InputFile);
    if(std::error_code ec = buf.getError()){
        errs() << "errorsmith_sites: " << InputFile << ": " << ec.message() << "\n";
        return 2;
    }
    errorsmith::SourceFile src(InputFile, (*buf)->getBuffer().str());

    errorsmith::go::Parser p;
    auto res = p.parse_string(src.content(), src.name());
    if(!res.success){
        errs() << src.name() << ":" << res.line << ":" << res.column << ": parse error: " << res.error_message << "\n";
        return 1;
    }
    if(DumpTree) outs() << errorsmith::go::dump(*res.file) << "\n";

    // Same walk as the rewrite, into a scratch buffer that is never materialized.
    errorsmith::EditBuffer scratch(src.content());
    errorsmith::Injector injector(src, scratch, 1, false);
    try {
        injector.walk(*res.file);
    } catch (const errorsmith::StructuralError& e) {
        errs() << "errorsmith_sites: " << src.name() << ": " << e.what() << "\n";
        return 1;
    }
    for(const auto& site : injector.sites()){
        outs() << site.file << ":" << site.line << ":" << src.column(site.offset) << ": " << guard_text(src.content(), site.offset) << "\n";
    }
    outs() << injector.sites().size() << " site(s)\n";
    return 0;
}
