// ast.hpp - the slice of the Go syntax tree the injector inspects
#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace errorsmith::go {

// Offsets are zero-based byte positions into the original source; `end` is exclusive.

struct Stmt;
struct Expr;
using StmtPtr = std::unique_ptr<Stmt>;
using ExprPtr = std::unique_ptr<Expr>;

struct Ident { std::string name; };
struct BinaryExpr { ExprPtr x; std::string op; ExprPtr y; };
// Any other expression. Owns the bodies of function literals written inside it.
struct OpaqueExpr { std::vector<StmtPtr> children; };

struct Expr {
    std::size_t pos{0};
    std::size_t end{0};
    std::variant<Ident, BinaryExpr, OpaqueExpr> data;
};

struct BlockStmt {
    std::size_t lbrace{0}; // offset of '{'
    std::size_t rbrace{0}; // offset of '}'
    std::vector<StmtPtr> list;
};

struct IfStmt {
    StmtPtr init;   // null when the header has no `init;` clause
    ExprPtr cond;
    BlockStmt body;
    StmtPtr else_;  // null, or a Stmt holding IfStmt or BlockStmt
};

enum class OpaqueKind { simple, decl, func_decl, for_loop, switch_stmt, select_stmt, case_head };

// Statements the injector never rewrites; `children` are the blocks and
// statements nested inside them (loop bodies, case clauses, closures).
struct OpaqueStmt {
    OpaqueKind kind{OpaqueKind::simple};
    std::vector<StmtPtr> children;
};

struct Stmt {
    std::size_t pos{0};
    std::size_t end{0};
    std::variant<IfStmt, BlockStmt, OpaqueStmt> data;
};

struct File {
    std::string package_name;
    std::size_t package_name_end{0};
    std::vector<StmtPtr> decls;
};

template<typename T>
inline StmtPtr make_stmt(std::size_t pos, std::size_t end, T data){
    auto s = std::make_unique<Stmt>();
    s->pos = pos; s->end = end; s->data = std::move(data);
    return s;
}

template<typename T>
inline ExprPtr make_expr(std::size_t pos, std::size_t end, T data){
    auto e = std::make_unique<Expr>();
    e->pos = pos; e->end = end; e->data = std::move(data);
    return e;
}

inline bool is_ident(const Expr* e, const char* name){
    if(!e || !std::holds_alternative<Ident>(e->data)) return false;
    return std::get<Ident>(e->data).name == name;
}

const char* to_string(OpaqueKind k);

// Compact s-expression rendering of the tree, e.g. `(file main (func { (if (!= err nil) { (simple) }) }))`.
std::string dump(const File& f);

} // namespace errorsmith::go
