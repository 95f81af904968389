#include <cassert>
#include <iostream>

void run_diagnostic_tests();
void run_environment_tests();
void run_eval_tests();
void run_lexer_tests();
void run_parser_tests();
void run_expander_tests();
void run_include_tests();
void run_predefine_tests();
void run_ast_kinds_tests();

int main() {
    run_diagnostic_tests();
    run_environment_tests();
    run_eval_tests();
    run_lexer_tests();
    run_parser_tests();
    run_expander_tests();
    run_include_tests();
    run_predefine_tests();
    run_ast_kinds_tests();
    std::cout << "All lexpp tests passed\n";
    return 0;
}
