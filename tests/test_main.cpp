#include "test_framework.h"

int tests_run = 0;
int tests_passed = 0;
int tests_failed = 0;

void run_source_location_tests();
void run_error_reporter_tests();
void run_diagnostic_tests();
void run_symbol_table_tests();
void run_types_tests();
void run_type_var_context_tests();
void run_type_checker_tests();
void run_protocols_tests();
void run_protocols_generic_tests();
void run_protocol_modules_tests();
void run_protocol_variance_tests();

static void run_all_tests() {
    std::cout << "Testing SourceLocation...\n";
    run_source_location_tests();

    std::cout << "Testing ErrorReporter...\n";
    run_error_reporter_tests();

    std::cout << "Testing DiagnosticAddendum...\n";
    run_diagnostic_tests();

    std::cout << "Testing SymbolTable...\n";
    run_symbol_table_tests();

    std::cout << "Testing type model...\n";
    run_types_tests();

    std::cout << "Testing TypeVarContext...\n";
    run_type_var_context_tests();

    std::cout << "Testing TypeChecker...\n";
    run_type_checker_tests();

    std::cout << "Testing protocol matching...\n";
    run_protocols_tests();

    std::cout << "Testing generic protocols...\n";
    run_protocols_generic_tests();

    std::cout << "Testing module protocols...\n";
    run_protocol_modules_tests();

    std::cout << "Testing protocol variance...\n";
    run_protocol_variance_tests();
}

int main() {
    std::cout << "Running protocheck Tests...\n\n";

    run_all_tests();

    std::cout << "\n";
    std::cout << "Tests run: " << tests_run << "\n";
    std::cout << "Tests passed: " << tests_passed << "\n";
    std::cout << "Tests failed: " << tests_failed << "\n";

    return tests_failed == 0 ? 0 : 1;
}
