#include <iostream>
#include <exception>
// Assert-based suites run first; GoogleTest cases compiled into the same binary
// (GTest::gtest, not gtest_main) are dispatched afterwards.
#include <gtest/gtest.h>

void run_edit_buffer_tests();
void run_text_locator_tests();
void run_parser_tests();
void run_template_tests();
void run_injector_tests();
void run_format_tests();
void run_diagnostics_json_tests();

int main(int argc, char** argv){
    try{
        run_edit_buffer_tests();
        run_text_locator_tests();
        run_parser_tests();
        run_template_tests();
        // Guard matching, else-chain rewrite, structural errors
        run_injector_tests();
        run_format_tests();
        run_diagnostics_json_tests();
    }catch(const std::exception& e){ std::cerr << "[errorsmith] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
