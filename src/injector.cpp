#include "errorsmith/injector.hpp"
#include "errorsmith/template.hpp"
#include "errorsmith/text_locator.hpp"
#include <llvm/Support/raw_ostream.h>
#include <utility>

namespace errorsmith {

StructuralError::StructuralError(std::size_t pos, std::string kw, const std::string& detail)
    : std::runtime_error("structural assumption violated: expected \"" + kw + "\" at offset " + std::to_string(pos) + (detail.empty() ? std::string() : " (" + detail + ")")),
      position(pos), keyword(std::move(kw)) {}

bool Injector::is_guard(const go::IfStmt& n){
    if(n.init || !n.cond) return false;
    const auto* b = std::get_if<go::BinaryExpr>(&n.cond->data);
    if(!b) return false;
    if(b->op != "==" && b->op != "!=") return false;
    return go::is_ident(b->x.get(), error_ident) && go::is_ident(b->y.get(), nil_ident);
}

void Injector::walk(go::File& file){
    for(auto& d : file.decls) walk_stmt(*d);
}

void Injector::walk_stmt(go::Stmt& s){
    if(auto* n = std::get_if<go::IfStmt>(&s.data)){ walk_if(s, *n); return; }
    if(auto* b = std::get_if<go::BlockStmt>(&s.data)){ walk_block(*b); return; }
    for(auto& c : std::get<go::OpaqueStmt>(s.data).children) walk_stmt(*c);
}

void Injector::walk_expr(go::Expr& e){
    if(auto* b = std::get_if<go::BinaryExpr>(&e.data)){ walk_expr(*b->x); walk_expr(*b->y); return; }
    if(auto* o = std::get_if<go::OpaqueExpr>(&e.data)){ for(auto& c : o->children) walk_stmt(*c); }
}

void Injector::walk_block(go::BlockStmt& b){
    for(auto& s : b.list) walk_stmt(*s);
}

void Injector::walk_if(go::Stmt& s, go::IfStmt& n){
    if(n.init) walk_stmt(*n.init);
    else if(is_guard(n)) inject(s.pos);
    walk_expr(*n.cond);
    walk_block(n.body);
    if(!n.else_) return;
    if(std::holds_alternative<go::BlockStmt>(n.else_->data)){ walk_stmt(*n.else_); return; }
    if(!std::holds_alternative<go::IfStmt>(n.else_->data)){
        throw StructuralError(n.else_->pos, "else", "else branch is neither an if statement nor a block");
    }
    normalize_else(n);
    walk_stmt(*n.else_);
}

// if A {...} else if B {...}  =>  if A {...} else { if B {...} }
void Injector::normalize_else(go::IfStmt& n){
    const std::size_t from = n.body.rbrace + 1;
    const std::size_t else_at = find_keyword(src_.content(), from, "else");
    if(else_at == keyword_npos) throw StructuralError(from, "else", "lost else");

    const std::size_t open = else_at + 4;
    const std::size_t close = n.else_->end;
    // The synthetic braces sit on lines of their own.
    edits_.insert(open, " {\n");
    edits_.insert(close, "\n}");

    go::BlockStmt block;
    block.lbrace = open;
    block.rbrace = close;
    block.list.push_back(std::move(n.else_));
    n.else_ = go::make_stmt(open, close, std::move(block));
}

void Injector::inject(std::size_t pos){
    const int line = src_.line(pos);
    edits_.insert(pos, render_injection(src_.name(), line, denominator_, trace_));
    sites_.push_back(InjectionSite{src_.name(), line, pos});
    if(log_sites_) llvm::errs() << "[errorsmith] injected " << src_.name() << ":" << line << "\n";
}

} // namespace errorsmith
