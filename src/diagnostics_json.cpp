#include "errorsmith/diagnostics_json.hpp"
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_ostream.h>

namespace errorsmith {

// llvm::json only holds UTF-8; file names and messages may not be.
static llvm::json::Value text(const std::string& s){
    if(llvm::json::isUTF8(s)) return s;
    return llvm::json::fixUTF8(s);
}

static std::string render(const llvm::json::Value& v){
    std::string out;
    llvm::raw_string_ostream os(out);
    os << v;
    os.flush();
    return out;
}

std::string json_escape(const std::string& s){
    return render(text(s));
}

std::string result_to_json(const InjectResult& r){
    llvm::json::Array sites;
    for(const auto& s : r.sites){
        sites.push_back(llvm::json::Object{
            {"file", text(s.file)},
            {"line", s.line},
            {"offset", static_cast<int64_t>(s.offset)},
        });
    }
    llvm::json::Object root{
        {"success", r.success},
        {"formatted", r.formatted},
        {"kind", to_string(r.kind)},
        {"sites", std::move(sites)},
    };
    if(r.kind != ErrorKind::none){
        root["error"] = llvm::json::Object{
            {"message", text(r.error_message)},
            {"line", r.line},
            {"col", r.column},
        };
    }
    return render(llvm::json::Value(std::move(root)));
}

void maybe_print_json(const InjectResult& r, const Env& env){
    if(!env.diag_json) return;
    llvm::errs() << result_to_json(r) << "\n";
}

} // namespace errorsmith
