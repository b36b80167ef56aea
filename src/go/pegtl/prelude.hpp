#pragma once
#include "errorsmith/go/ast.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace errorsmith::go::pegtl_front {

// Shared state threaded through the grammar actions.
//
// Actions fire bottom-up, so finished pieces wait on stacks until the rule
// that owns them completes: statements on `stmts` (split per block by `marks`),
// closed blocks on `blocks`, closure bodies on `pending`. Every rule that fires
// an action is committed (`must<>`) by the time it does, so nothing here needs
// to be rolled back on backtracking.
struct build_state {
    struct mark { std::size_t stmts; std::size_t pending; };
    struct if_frame {
        std::size_t pos{0};
        std::size_t a_begin{0}, a_end{0};
        std::size_t b_begin{0}, b_end{0};
        bool has_b{false};
        std::vector<StmtPtr> a_children, b_children;
        BlockStmt body;
        StmtPtr else_;
    };

    std::string_view src;
    std::vector<StmtPtr> stmts;
    std::vector<mark> marks;
    std::vector<StmtPtr> blocks;
    std::vector<StmtPtr> pending;
    std::vector<if_frame> ifs;
    std::vector<std::vector<StmtPtr>> headers;
    std::string package_name;
    std::size_t package_name_end{0};
    std::size_t error_offset{0};
    std::string error_message;

    template<typename Input>
    std::size_t begin_of(const Input& in) const { return static_cast<std::size_t>(in.begin() - src.data()); }
    template<typename Input>
    std::size_t end_of(const Input& in) const { return begin_of(in) + in.size(); }

    // Closure bodies produced since the innermost open block started.
    std::vector<StmtPtr> take_pending(){
        const std::size_t from = marks.empty() ? 0 : marks.back().pending;
        std::vector<StmtPtr> out;
        for(std::size_t i=from;i<pending.size();++i) out.push_back(std::move(pending[i]));
        pending.resize(from);
        return out;
    }

    StmtPtr pop_block(){ auto b = std::move(blocks.back()); blocks.pop_back(); return b; }

    void open_block(){ marks.push_back(mark{stmts.size(), pending.size()}); }

    void close_block(std::size_t begin, std::size_t end){
        const mark m = marks.back(); marks.pop_back();
        BlockStmt b; b.lbrace = begin; b.rbrace = end - 1;
        for(std::size_t i=m.stmts;i<stmts.size();++i) b.list.push_back(std::move(stmts[i]));
        stmts.resize(m.stmts);
        blocks.push_back(make_stmt(begin, end, std::move(b)));
    }

    void push_opaque(OpaqueKind kind, std::size_t begin, std::size_t end, std::vector<StmtPtr> children){
        stmts.push_back(make_stmt(begin, end, OpaqueStmt{kind, std::move(children)}));
    }
};

inline bool is_space(char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'||c=='\f'||c=='\v'; }

} // namespace errorsmith::go::pegtl_front
