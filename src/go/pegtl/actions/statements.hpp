#pragma once
#include "../prelude.hpp"
#include "../grammar.hpp"
#include "errorsmith/go/parser.hpp"
#include <tao/pegtl.hpp>

namespace errorsmith::go::pegtl_front::actions {
using namespace tao::pegtl;
using errorsmith::go::pegtl_front::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

// Blocks: remember where this block's statements start, collect them when it closes.
template<> struct action< grammar::block_open > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.open_block(); }
};
template<> struct action< grammar::block > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.close_block(st.begin_of(in), st.end_of(in)); }
};
template<> struct action< grammar::clause_block > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.close_block(st.begin_of(in), st.end_of(in)); }
};
template<> struct action< grammar::block_stmt > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.stmts.push_back(st.pop_block()); }
};

// Closures: the body waits on `pending` until the enclosing statement claims it.
template<> struct action< grammar::func_lit > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.pending.push_back(st.pop_block()); }
};

template<> struct action< grammar::simple_stmt > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.push_opaque(OpaqueKind::simple, st.begin_of(in), st.end_of(in), st.take_pending());
    }
};

// if / else
template<> struct action< grammar::if_kw > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        build_state::if_frame f; f.pos = st.begin_of(in);
        st.ifs.push_back(std::move(f));
    }
};
template<> struct action< grammar::if_clause_a > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto& f = st.ifs.back();
        f.a_begin = st.begin_of(in); f.a_end = st.end_of(in);
        f.a_children = st.take_pending();
    }
};
template<> struct action< grammar::if_clause_b > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto& f = st.ifs.back();
        f.b_begin = st.begin_of(in); f.b_end = st.end_of(in); f.has_b = true;
        f.b_children = st.take_pending();
    }
};
template<> struct action< grammar::if_body > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto b = st.pop_block();
        st.ifs.back().body = std::move(std::get<BlockStmt>(b->data));
    }
};
template<> struct action< grammar::else_block > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.ifs.back().else_ = st.pop_block(); }
};
// The nested if-statement has just pushed itself as a statement; it belongs to the else instead.
template<> struct action< grammar::else_if > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        st.ifs.back().else_ = std::move(st.stmts.back());
        st.stmts.pop_back();
    }
};
template<> struct action< grammar::if_stmt > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto f = std::move(st.ifs.back()); st.ifs.pop_back();
        IfStmt s;
        auto cond_expr = [&](std::size_t b, std::size_t e, std::vector<StmtPtr> children){
            auto x = classify_condition(st.src.substr(b, e - b), b);
            if(auto* o = std::get_if<OpaqueExpr>(&x->data)) o->children = std::move(children);
            return x;
        };
        if(f.has_b){
            s.init = make_stmt(f.a_begin, f.a_end, OpaqueStmt{OpaqueKind::simple, std::move(f.a_children)});
            s.cond = cond_expr(f.b_begin, f.b_end, std::move(f.b_children));
        } else {
            s.cond = cond_expr(f.a_begin, f.a_end, std::move(f.a_children));
        }
        s.body = std::move(f.body);
        s.else_ = std::move(f.else_);
        st.stmts.push_back(make_stmt(f.pos, st.end_of(in), std::move(s)));
    }
};

// for / switch / select: header closures first, then the body block.
template<> struct action< grammar::loop_header > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.headers.push_back(st.take_pending()); }
};
template<> struct action< grammar::for_stmt > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto children = std::move(st.headers.back()); st.headers.pop_back();
        children.push_back(st.pop_block());
        st.push_opaque(OpaqueKind::for_loop, st.begin_of(in), st.end_of(in), std::move(children));
    }
};
template<> struct action< grammar::switch_stmt > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto children = std::move(st.headers.back()); st.headers.pop_back();
        children.push_back(st.pop_block());
        const auto kind = in.string_view().substr(0, 6) == "select" ? OpaqueKind::select_stmt : OpaqueKind::switch_stmt;
        st.push_opaque(kind, st.begin_of(in), st.end_of(in), std::move(children));
    }
};
// Closures in a case expression are kept as a statement of their clause.
template<> struct action< grammar::case_head > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto children = st.take_pending();
        if(!children.empty()) st.push_opaque(OpaqueKind::case_head, st.begin_of(in), st.end_of(in), std::move(children));
    }
};

} // namespace errorsmith::go::pegtl_front::actions
