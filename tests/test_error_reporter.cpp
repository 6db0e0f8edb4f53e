#include "protocheck/diagnostic.h"
#include "protocheck/error_reporter.h"
#include "protocheck/source_location.h"
#include "test_framework.h"
#include <string>

TEST(error_reporter_basic) {
    protocheck::ErrorReporter reporter;

    ASSERT(!reporter.hasErrors(), "Should start with no errors");
    ASSERT_EQ(reporter.getErrorCount(), 0, "Error count should be 0");

    protocheck::SourceLocation loc(10, 5);
    reporter.error(loc, "Test error");

    ASSERT(reporter.hasErrors(), "Should have errors after adding one");
    ASSERT_EQ(reporter.getErrorCount(), 1, "Error count should be 1");
}

TEST(error_reporter_warnings) {
    protocheck::ErrorReporter reporter;

    protocheck::SourceLocation loc(5, 3);
    reporter.warning(loc, "Test warning");

    ASSERT(!reporter.hasErrors(), "Warnings should not count as errors");
    ASSERT_EQ(reporter.getWarningCount(), 1, "Warning count should be 1");
}

TEST(error_reporter_error_codes) {
    protocheck::ErrorReporter reporter;
    protocheck::SourceLocation loc(2, 1, "app.py");

    reporter.error(loc, "Incompatible", protocheck::ErrorCode(protocheck::ErrorCodes::PROTOCOL_MISMATCH, "protocol"));
    reporter.warning(loc, "Variance", protocheck::ErrorCode(protocheck::ErrorCodes::PROTOCOL_VARIANCE, "variance"));

    const auto& errors = reporter.getErrors();
    ASSERT_EQ(errors.size(), 2, "Should record both entries");
    ASSERT_EQ(errors[0].errorCode.code, "E301", "Protocol mismatch should be E301");
    ASSERT_EQ(errors[0].errorCode.category, "protocol", "Category should be kept");
    ASSERT(errors[1].level == protocheck::ErrorLevel::Warning, "Second entry should be a warning");
    ASSERT_EQ(errors[1].errorCode.code, "W100", "Variance warning should be W100");
}

TEST(error_reporter_notes_attach_to_last_entry) {
    protocheck::ErrorReporter reporter;
    protocheck::SourceLocation loc(1, 1);

    // Nothing to attach to yet
    reporter.addNote("dropped");

    reporter.error(loc, "First");
    reporter.error(loc, "Second");
    reporter.addNote("about second");

    const auto& errors = reporter.getErrors();
    ASSERT(errors[0].notes.empty(), "First entry should have no notes");
    ASSERT_EQ(errors[1].notes.size(), 1, "Second entry should have one note");
    ASSERT_EQ(errors[1].notes[0], "about second", "Note text should be kept");
}

TEST(error_reporter_add_notes_from_addendum) {
    protocheck::ErrorReporter reporter;
    protocheck::SourceLocation loc(1, 1);

    protocheck::DiagnosticAddendum diag;
    diag.addMessage("\"close\" is not present");
    diag.createAddendum()->addMessage("nested");

    reporter.error(loc, "Mismatch");
    reporter.addNotes(diag, protocheck::defaultMaxDiagnosticDepth, protocheck::defaultMaxDiagnosticLineCount);

    const auto& notes = reporter.getErrors().back().notes;
    ASSERT_EQ(notes.size(), 2, "Each rendered line should become a note");
    ASSERT_EQ(notes[0], "  \"close\" is not present", "Top-level message should be indented once");
    ASSERT_EQ(notes[1], "    nested", "Child message should be indented twice");
}

TEST(error_reporter_source_line) {
    protocheck::ErrorReporter reporter;
    reporter.setSource("app.py", "x: int = 1\n\ty: Proto = C()\n");

    protocheck::SourceLocation loc(2, 2, "app.py");
    reporter.error(loc, "Mismatch");

    const auto& error = reporter.getErrors().back();
    ASSERT_EQ(error.sourceLine, "\ty: Proto = C()", "Should capture the offending line");
    ASSERT_EQ(error.underlineStart, 4, "Tab should expand to the default width");
}

TEST(error_reporter_format_error) {
    protocheck::ErrorReporter reporter;
    reporter.setSource("app.py", "x: int = 1\r\ny: Proto = C()\r\n");

    protocheck::SourceLocation loc(2, 12, "app.py");
    reporter.error(loc, "Mismatch", protocheck::ErrorCode(protocheck::ErrorCodes::PROTOCOL_MISMATCH, "protocol"));
    reporter.addNote("  \"close\" is not present");

    std::string text = reporter.formatError(reporter.getErrors().back());
    ASSERT(text.find("error[E301]: app.py:2:12: Mismatch\n") == 0, "Header should lead with level, code and location");
    ASSERT(text.find("y: Proto = C()\n") != std::string::npos, "Carriage return should be stripped from the quoted line");
    ASSERT(text.find("|            ^\n") != std::string::npos, "Caret should sit under column 12");
    ASSERT(text.find("  note:  \"close\" is not present\n") != std::string::npos, "Notes should follow the excerpt");
}

TEST(error_reporter_location_past_end_of_source) {
    protocheck::ErrorReporter reporter;
    reporter.setSource("app.py", "x = 1");

    reporter.error(protocheck::SourceLocation(7, 1, "app.py"), "Out of range");
    ASSERT(reporter.getErrors().back().sourceLine.empty(), "No line should be quoted past the end of the file");
}

TEST(error_reporter_clear) {
    protocheck::ErrorReporter reporter;

    protocheck::SourceLocation loc(1, 1);
    reporter.error(loc, "Error 1");
    reporter.error(loc, "Error 2");
    reporter.warning(loc, "Warning 1");

    ASSERT_EQ(reporter.getErrorCount(), 2, "Should have 2 errors");

    reporter.clear();

    ASSERT(!reporter.hasErrors(), "Should have no errors after clear");
    ASSERT_EQ(reporter.getErrorCount(), 0, "Error count should be 0 after clear");
    ASSERT_EQ(reporter.getWarningCount(), 0, "Warning count should be 0 after clear");
    ASSERT(reporter.getErrors().empty(), "Entries should be gone after clear");
}

void run_error_reporter_tests() {
    RUN_TEST(error_reporter_basic);
    RUN_TEST(error_reporter_warnings);
    RUN_TEST(error_reporter_error_codes);
    RUN_TEST(error_reporter_notes_attach_to_last_entry);
    RUN_TEST(error_reporter_add_notes_from_addendum);
    RUN_TEST(error_reporter_source_line);
    RUN_TEST(error_reporter_format_error);
    RUN_TEST(error_reporter_location_past_end_of_source);
    RUN_TEST(error_reporter_clear);
}
