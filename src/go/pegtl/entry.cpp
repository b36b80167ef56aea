#include "errorsmith/go/parser.hpp"
#include "errorsmith/source.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions/all.hpp"
#include <tao/pegtl.hpp>
#include <string>
#include <type_traits>

namespace errorsmith::go {
using namespace errorsmith::go::pegtl_front;
using namespace errorsmith::go::pegtl_front::grammar;
using namespace errorsmith::go::pegtl_front::actions;

namespace {

template<typename Rule>
const char* expected(){
    if constexpr(std::is_same_v<Rule, block_close>) return "expected '}' to close block";
    else if constexpr(std::is_same_v<Rule, tao::pegtl::one<')'>>) return "expected ')'";
    else if constexpr(std::is_same_v<Rule, tao::pegtl::one<']'>>) return "expected ']'";
    else if constexpr(std::is_same_v<Rule, tao::pegtl::one<'}'>>) return "expected '}'";
    else if constexpr(std::is_same_v<Rule, tao::pegtl::one<':'>>) return "expected ':' after case";
    else if constexpr(std::is_same_v<Rule, package_clause>) return "expected 'package' clause";
    else if constexpr(std::is_same_v<Rule, package_name>) return "expected package name";
    else if constexpr(std::is_same_v<Rule, if_header>) return "expected condition after 'if'";
    else if constexpr(std::is_same_v<Rule, if_body> || std::is_same_v<Rule, for_body>) return "expected '{' to open block";
    else if constexpr(std::is_same_v<Rule, clause_block>) return "expected '{' after switch header";
    else if constexpr(std::is_same_v<Rule, tao::pegtl::sor<else_if, else_block>>) return "expected 'if' or block after 'else'";
    else if constexpr(std::is_same_v<Rule, tao::pegtl::eof>) return "unexpected token at top level";
    else return nullptr;
}

// Records where and why a committed rule failed so the caller can report
// line, column and a message without PEGTL's position prefix.
template<typename Rule>
struct control : tao::pegtl::normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&... st){
        const char* msg = expected<Rule>();
        const std::string text = msg ? std::string(msg) : "parse error matching " + std::string(tao::pegtl::demangle<Rule>());
        (note(in, text, st), ...);
        throw tao::pegtl::parse_error(text, in);
    }
    template<typename ParseInput>
    static void note(const ParseInput& in, const std::string& text, build_state& st){
        st.error_offset = static_cast<std::size_t>(in.current() - st.src.data());
        st.error_message = text;
    }
};

struct cond_state {
    const char* base{nullptr};
    std::string x, op, y;
    std::size_t x_at{0}, x_end{0}, y_at{0}, y_end{0};
};

template<typename Rule>
struct cond_action : tao::pegtl::nothing<Rule> {};
template<> struct cond_action< cond_x > {
    template<typename Input>
    static void apply(const Input& in, cond_state& cs){
        cs.x = in.string(); cs.x_at = static_cast<std::size_t>(in.begin() - cs.base); cs.x_end = cs.x_at + in.size();
    }
};
template<> struct cond_action< cond_op > {
    template<typename Input>
    static void apply(const Input& in, cond_state& cs){ cs.op = in.string(); }
};
template<> struct cond_action< cond_y > {
    template<typename Input>
    static void apply(const Input& in, cond_state& cs){
        cs.y = in.string(); cs.y_at = static_cast<std::size_t>(in.begin() - cs.base); cs.y_end = cs.y_at + in.size();
    }
};

} // namespace

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    build_state st;
    st.src = src;
    try {
        tao::pegtl::parse< file_rule, action, control >(in, st);
        auto file = std::make_unique<File>();
        file->package_name = std::move(st.package_name);
        file->package_name_end = st.package_name_end;
        file->decls = std::move(st.stmts);
        ParseResult r; r.success=true; r.file = std::move(file); return r;
    } catch (const tao::pegtl::parse_error& e) {
        SourceFile sf{std::string(filename), std::string(src)};
        ParseResult r; r.success=false;
        r.error_message = st.error_message.empty() ? std::string(e.what()) : st.error_message;
        r.line = sf.line(st.error_offset); r.column = sf.column(st.error_offset);
        return r;
    }
}

ExprPtr classify_condition(std::string_view cond_text, std::size_t base){
    std::size_t b = 0, e = cond_text.size();
    while(b < e && is_space(cond_text[b])) ++b;
    while(e > b && is_space(cond_text[e-1])) --e;

    cond_state cs; cs.base = cond_text.data();
    tao::pegtl::memory_input in(cond_text.data(), cond_text.size(), "cond");
    if(tao::pegtl::parse< cond_rule, cond_action >(in, cs)){
        BinaryExpr be;
        be.x = make_expr(base + cs.x_at, base + cs.x_end, Ident{cs.x});
        be.op = cs.op;
        be.y = make_expr(base + cs.y_at, base + cs.y_end, Ident{cs.y});
        return make_expr(base + b, base + e, std::move(be));
    }
    return make_expr(base + b, base + e, OpaqueExpr{});
}

} // namespace errorsmith::go
