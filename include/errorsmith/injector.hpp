// injector.hpp - guard matcher, tree walk and else-chain normalization
#pragma once
#include "errorsmith/edit_buffer.hpp"
#include "errorsmith/go/ast.hpp"
#include "errorsmith/source.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace errorsmith {

// A syntactic landmark the walk relies on was missing, or a node had a shape the
// grammar cannot produce. Not an input error: the tree and text disagree.
struct StructuralError : std::runtime_error {
    StructuralError(std::size_t position, std::string keyword, const std::string& detail);
    std::size_t position;
    std::string keyword;
};

struct InjectionSite {
    std::string file;
    int line{0};
    std::size_t offset{0};
};

// Walks a parsed file in source order, scheduling one injection before every
// `if err == nil` / `if err != nil` without an init clause. `else if` chains are
// rewritten to `else { if ... }` (text and tree) so the nested guard has a block to
// receive its own injection.
class Injector {
public:
    Injector(const SourceFile& src, EditBuffer& edits, int denominator, bool trace)
        : src_(src), edits_(edits), denominator_(denominator), trace_(trace) {}

    // Log each site to llvm::errs() as it is scheduled.
    Injector& log_sites(bool on){ log_sites_ = on; return *this; }

    void walk(go::File& file);
    void walk_stmt(go::Stmt& s);

    static bool is_guard(const go::IfStmt& n);

    const std::vector<InjectionSite>& sites() const { return sites_; }

private:
    void walk_expr(go::Expr& e);
    void walk_block(go::BlockStmt& b);
    void walk_if(go::Stmt& s, go::IfStmt& n);
    void normalize_else(go::IfStmt& n);
    void inject(std::size_t pos);

    const SourceFile& src_;
    EditBuffer& edits_;
    int denominator_;
    bool trace_;
    bool log_sites_{false};
    std::vector<InjectionSite> sites_;
};

} // namespace errorsmith
