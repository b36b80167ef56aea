#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "errorsmith/edit_buffer.hpp"
#include "errorsmith/source.hpp"

using namespace errorsmith;

static void test_ties_render_in_call_order(){
    EditBuffer b("abc");
    b.insert(1, "X");
    b.insert(1, "Y");
    b.insert(0, "<");
    b.insert(3, ">");
    assert(b.materialize() == "<aXYbc>");
    assert(b.edit_count() == 4);
    // Pure: nothing is consumed, the original is untouched.
    assert(b.materialize() == "<aXYbc>");
    assert(b.original() == "abc");
}

static void test_call_order_does_not_shift_positions(){
    EditBuffer b("abc");
    b.insert(3, ">");
    b.insert(0, "<");
    b.insert(2, "-");
    assert(b.materialize() == "<ab-c>");
}

// The one real tie: an else brace opened right where an injection lands.
static void test_brace_before_injection(){
    EditBuffer b("else if x {}");
    b.insert(4, "{");
    b.insert(4, "\nINJ\n");
    b.insert(12, "}");
    assert(b.materialize() == "else{\nINJ\n if x {}}");
}

static void test_out_of_range(){
    EditBuffer b("abc");
    bool threw = false;
    try { b.insert(4, "z"); } catch (const std::out_of_range&) { threw = true; }
    assert(threw && "insert past the end must be rejected");
    assert(b.edit_count() == 0);
    b.insert(3, "z");
    assert(b.materialize() == "abcz");
}

static void test_empty_buffer(){
    EditBuffer b("");
    assert(b.materialize().empty());
    b.insert(0, "a");
    b.insert(0, "b");
    assert(b.materialize() == "ab");
}

static void test_source_lines(){
    SourceFile f("f.go", "a\nbc\n");
    assert(f.line(0) == 1);
    assert(f.line(1) == 1);
    assert(f.line(2) == 2);
    assert(f.column(3) == 2);
    assert(f.line(5) == 3);
    assert(f.column(5) == 1);
}

void run_edit_buffer_tests(){
    std::cout << "[edit_buffer] tests...\n";
    test_ties_render_in_call_order();
    test_call_order_does_not_shift_positions();
    test_brace_before_injection();
    test_out_of_range();
    test_empty_buffer();
    test_source_lines();
    std::cout << "[edit_buffer] tests passed\n";
}
