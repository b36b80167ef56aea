#include <cassert>
#include <iostream>
#include <string>
#include "errorsmith/go/ast.hpp"
#include "errorsmith/go/parser.hpp"

using namespace errorsmith::go;

static std::string dump_of(const std::string& src){
    Parser p;
    auto r = p.parse_string(src, "t.go");
    if(!r.success){ std::cerr << "unexpected parse failure: " << r.error_message << "\n"; assert(false); }
    return dump(*r.file);
}

static std::string in_func(const std::string& body){
    return "package main\n\nfunc f() {\n" + body + "}\n";
}

static void test_guard_shapes(){
    const std::string src =
        "package main\n"
        "\n"
        "import \"fmt\"\n"
        "\n"
        "func f() error {\n"
        "\terr := g()\n"
        "\tif err != nil {\n"
        "\t\treturn err\n"
        "\t}\n"
        "\treturn nil\n"
        "}\n";
    auto d = dump_of(src);
    assert(d == "(file main (decl) (func { (simple) (if (!= err nil) { (simple) }) (simple) }))");

    assert(dump_of(in_func("\tif nil != err {\n\t}\n")) == "(file main (func { (if (!= nil err) {}) }))");
    assert(dump_of(in_func("\tif (err != nil) {\n\t}\n")) == "(file main (func { (if ? {}) }))");
    assert(dump_of(in_func("\tif err.Code != nil {\n\t}\n")) == "(file main (func { (if ? {}) }))");
    assert(dump_of(in_func("\tif err != nil && ok {\n\t}\n")) == "(file main (func { (if ? {}) }))");
}

static void test_init_clause(){
    auto d = dump_of(in_func("\tif err, ok := f(); err != nil {\n\t\t_ = ok\n\t}\n"));
    assert(d == "(file main (func { (if [init (simple)] (!= err nil) { (simple) }) }))");
}

static void test_condition_offsets(){
    const std::string src = in_func("\tif err == nil {\n\t}\n");
    Parser p;
    auto r = p.parse_string(src);
    assert(r.success);
    auto& fn = std::get<OpaqueStmt>(r.file->decls[0]->data);
    auto& body = std::get<BlockStmt>(fn.children[0]->data);
    auto& s = *body.list[0];
    auto& n = std::get<IfStmt>(s.data);
    assert(src.compare(s.pos, 2, "if") == 0);
    assert(src.substr(n.cond->pos, n.cond->end - n.cond->pos) == "err == nil");
    auto& b = std::get<BinaryExpr>(n.cond->data);
    assert(src.substr(b.x->pos, 3) == "err");
    assert(src.substr(b.y->pos, 3) == "nil");
    assert(src[n.body.lbrace] == '{');
    assert(src[n.body.rbrace] == '}');
    assert(s.end == n.body.rbrace + 1);
}

static void test_else_chain(){
    auto d = dump_of(in_func(
        "\tif err == nil {\n"
        "\t\ta()\n"
        "\t} else if err != nil {\n"
        "\t\tb()\n"
        "\t} else {\n"
        "\t\tc()\n"
        "\t}\n"));
    assert(d == "(file main (func { (if (== err nil) { (simple) } else (if (!= err nil) { (simple) } else { (simple) })) }))");
}

static void test_closures_and_clauses(){
    assert(dump_of(in_func("\tgo func() {\n\t\tif err != nil {\n\t\t}\n\t}()\n"))
           == "(file main (func { (simple { (if (!= err nil) {}) }) }))");
    assert(dump_of(in_func("\tswitch x {\n\tcase 1:\n\t\tif err != nil {\n\t\t}\n\tdefault:\n\t}\n"))
           == "(file main (func { (switch { (if (!= err nil) {}) }) }))");
    assert(dump_of(in_func("\tselect {\n\tcase v := <-ch:\n\t\t_ = v\n\t}\n"))
           == "(file main (func { (select { (simple) }) }))");
    assert(dump_of(in_func("Loop:\n\tfor {\n\t\tif err != nil {\n\t\t\tbreak Loop\n\t\t}\n\t}\n"))
           == "(file main (func { (for { (if (!= err nil) { (simple) }) }) }))");
    assert(dump_of(in_func("\tif ok := func() bool { return true }(); ok {\n\t}\n"))
           == "(file main (func { (if [init (simple { (simple) })] ? {}) }))");
    assert(dump_of("package main\n\nvar handler = func() {\n\tif err != nil {\n\t}\n}\n")
           == "(file main (decl { (if (!= err nil) {}) }))");
}

static void test_literals_and_comments(){
    auto d = dump_of(in_func(
        "\t// if err != nil {\n"
        "\ts := \"if err != nil {\"\n"
        "\tr := `{`\n"
        "\tc := '{'\n"
        "\t/* } */\n"));
    assert(d == "(file main (func { (simple) (simple) (simple) }))");
    // multi-line composite literal and operator continuation stay one statement
    assert(dump_of(in_func("\tx := []int{\n\t\t1,\n\t\t2,\n\t}\n\ty := a +\n\t\tb\n")) == "(file main (func { (simple) (simple) }))");
}

static void test_errors(){
    Parser p;
    {
        auto r = p.parse_string("package main\nfunc f() {\n", "bad.go");
        assert(!r.success);
        // the message carries no position prefix; line and column are separate
        assert(r.error_message == "expected '}' to close block");
        assert(r.line == 3 && r.column == 1);
    }
    {
        auto r = p.parse_string("func f() {}\n", "nopkg.go");
        assert(!r.success);
        assert(r.error_message == "expected 'package' clause");
        assert(r.line == 1);
    }
    {
        auto r = p.parse_string("package main\nfunc f() {\n\tx := (1\n}\n", "paren.go");
        assert(!r.success);
        assert(r.error_message == "expected ')'");
        assert(r.line == 4 && r.column == 1);
    }
}

void run_parser_tests(){
    std::cout << "[parser] tests...\n";
    test_guard_shapes();
    test_init_clause();
    test_condition_offsets();
    test_else_chain();
    test_closures_and_clauses();
    test_literals_and_comments();
    test_errors();
    std::cout << "[parser] tests passed\n";
}
