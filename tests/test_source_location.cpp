#include "protocheck/source_location.h"
#include "test_framework.h"

TEST(source_location_basic) {
    protocheck::SourceLocation loc(10, 20, "shapes.py");

    ASSERT_EQ(loc.getLine(), 10, "Line should be 10");
    ASSERT_EQ(loc.getColumn(), 20, "Column should be 20");
    ASSERT_EQ(loc.getFile(), "shapes.py", "File should be shapes.py");
}

TEST(source_location_default) {
    protocheck::SourceLocation loc;

    ASSERT_EQ(loc.getLine(), 1, "Default line should be 1");
    ASSERT_EQ(loc.getColumn(), 1, "Default column should be 1");
    ASSERT_EQ(loc.getFile(), "", "Default file should be empty");
    ASSERT(loc.isValid(), "Default location should be valid");
}

TEST(source_location_to_string) {
    protocheck::SourceLocation loc(5, 10, "example.py");
    ASSERT_EQ(loc.toString(), "example.py:5:10", "Should render file:line:column");

    protocheck::SourceLocation anonymous(7, 3);
    ASSERT_EQ(anonymous.toString(), "7:3", "Anonymous location should omit the file");
}

TEST(source_location_equality) {
    protocheck::SourceLocation a(3, 4, "m.py");
    protocheck::SourceLocation b(3, 4, "m.py");
    protocheck::SourceLocation c(3, 5, "m.py");

    ASSERT(a == b, "Same position should compare equal");
    ASSERT(a != c, "Different columns should compare unequal");

    c.setColumn(4);
    ASSERT(a == c, "Should compare equal after setColumn");
}

void run_source_location_tests() {
    RUN_TEST(source_location_basic);
    RUN_TEST(source_location_default);
    RUN_TEST(source_location_to_string);
    RUN_TEST(source_location_equality);
}
