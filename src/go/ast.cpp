#include "errorsmith/go/ast.hpp"
#include <sstream>

namespace errorsmith::go {

const char* to_string(OpaqueKind k){
    switch(k){
        case OpaqueKind::simple: return "simple";
        case OpaqueKind::decl: return "decl";
        case OpaqueKind::func_decl: return "func";
        case OpaqueKind::for_loop: return "for";
        case OpaqueKind::switch_stmt: return "switch";
        case OpaqueKind::select_stmt: return "select";
        case OpaqueKind::case_head: return "case";
    }
    return "?";
}

} // namespace errorsmith::go

namespace errorsmith::go {

static void dump_stmt(std::ostringstream& os, const Stmt& s);

static void dump_children(std::ostringstream& os, const std::vector<StmtPtr>& xs){
    for(const auto& c : xs){ os << ' '; dump_stmt(os, *c); }
}

static void dump_expr(std::ostringstream& os, const Expr& e){
    if(auto* id = std::get_if<Ident>(&e.data)){ os << id->name; return; }
    if(auto* b = std::get_if<BinaryExpr>(&e.data)){ os << '(' << b->op << ' '; dump_expr(os, *b->x); os << ' '; dump_expr(os, *b->y); os << ')'; return; }
    const auto& o = std::get<OpaqueExpr>(e.data);
    if(o.children.empty()){ os << '?'; return; }
    os << "(?"; dump_children(os, o.children); os << ')';
}

static void dump_block(std::ostringstream& os, const BlockStmt& b){
    os << '{'; dump_children(os, b.list); os << (b.list.empty() ? "}" : " }");
}

static void dump_stmt(std::ostringstream& os, const Stmt& s){
    if(auto* i = std::get_if<IfStmt>(&s.data)){
        os << "(if";
        if(i->init){ os << " [init "; dump_stmt(os, *i->init); os << ']'; }
        os << ' '; dump_expr(os, *i->cond);
        os << ' '; dump_block(os, i->body);
        if(i->else_){ os << " else "; dump_stmt(os, *i->else_); }
        os << ')';
        return;
    }
    if(auto* b = std::get_if<BlockStmt>(&s.data)){ dump_block(os, *b); return; }
    const auto& o = std::get<OpaqueStmt>(s.data);
    os << '(' << to_string(o.kind); dump_children(os, o.children); os << ')';
}

std::string dump(const File& f){
    std::ostringstream os;
    os << "(file " << f.package_name;
    dump_children(os, f.decls);
    os << ')';
    return os.str();
}

} // namespace errorsmith::go
