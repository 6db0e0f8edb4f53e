#include "protocheck/types/symbol.h"
#include "protocheck/types/types.h"
#include "test_framework.h"

using namespace protocheck;

TEST(symbol_table_insert_lookup) {
    types::SymbolTable table;

    types::Symbol* inserted = table.insert("x", std::make_unique<types::Symbol>(types::SymbolFlags::ClassMember));
    ASSERT_NE(inserted, nullptr, "Should insert symbol");

    types::Symbol* found = table.lookup("x");
    ASSERT_EQ(found, inserted, "Should find the inserted symbol");
    ASSERT(table.contains("x"), "contains should agree with lookup");
    ASSERT(table.lookup("y") == nullptr, "Unknown names are not found");
}

TEST(symbol_table_duplicate) {
    types::SymbolTable table;
    table.insert("x", std::make_unique<types::Symbol>(types::SymbolFlags::ClassMember));

    types::Symbol* duplicate = table.insert("x", std::make_unique<types::Symbol>(types::SymbolFlags::None));
    ASSERT(duplicate == nullptr, "Duplicate names should be rejected");
    ASSERT_EQ(table.size(), 1, "Table should still hold one symbol");
    ASSERT(table.lookup("x")->isClassMember(), "Original symbol should be kept");
}

TEST(symbol_table_insertion_order) {
    types::SymbolTable table;
    const char* names[] = {"zeta", "alpha", "mid", "beta"};
    for (const char* name : names) {
        table.insert(name, std::make_unique<types::Symbol>(types::SymbolFlags::ClassMember));
    }

    size_t index = 0;
    bool inOrder = true;
    for (const auto& entry : table) {
        if (entry.first != names[index++]) {
            inOrder = false;
        }
    }
    ASSERT(inOrder, "Iteration should follow declaration order");
    ASSERT_EQ(index, 4, "Should visit every symbol");
}

TEST(symbol_typed_declarations) {
    types::Symbol symbol(types::SymbolFlags::ClassMember);
    ASSERT(!symbol.hasTypedDeclarations(), "No declarations yet");

    symbol.addDeclaration(types::Declaration::inferredVariable(types::AnyType::create()));
    ASSERT(!symbol.hasTypedDeclarations(), "Inferred variables are not typed");

    symbol.addDeclaration(types::Declaration::variable(types::NoneType::create()));
    ASSERT(symbol.hasTypedDeclarations(), "Annotated variables are typed");
    ASSERT_EQ(symbol.getTypedDeclarations().size(), 1, "Only the annotated declaration counts");
}

TEST(symbol_final_variable) {
    types::Symbol annotated(types::SymbolFlags::ClassMember);
    annotated.addDeclaration(types::Declaration::variable(types::AnyType::create(), true));
    ASSERT(annotated.isFinalVariable(), "Final annotation marks the symbol final");

    // "x: Final = 3"
    types::Symbol inferred(types::SymbolFlags::ClassMember);
    inferred.addDeclaration(types::Declaration::inferredVariable(types::AnyType::create(), true));
    ASSERT(inferred.hasTypedDeclarations(), "Final variables count as typed");
    ASSERT(inferred.isFinalVariable(), "Unannotated Final is still final");

    types::Symbol plain(types::SymbolFlags::ClassMember);
    plain.addDeclaration(types::Declaration::variable(types::AnyType::create()));
    ASSERT(!plain.isFinalVariable(), "Plain variables are not final");
}

TEST(symbol_synthesized_type) {
    std::unique_ptr<types::Symbol> symbol =
        types::Symbol::createWithType(types::SymbolFlags::ClassMember | types::SymbolFlags::ClassVar,
                                      types::AnyType::create());
    ASSERT(symbol->hasTypedDeclarations(), "Synthesized symbols are typed");
    ASSERT(symbol->getDeclarations().empty(), "No source declarations");
    ASSERT(symbol->isClassVar(), "Flags should be kept");
    ASSERT(symbol->getSynthesizedType() == types::AnyType::create(), "Synthesized type should be kept");
}

void run_symbol_table_tests() {
    RUN_TEST(symbol_table_insert_lookup);
    RUN_TEST(symbol_table_duplicate);
    RUN_TEST(symbol_table_insertion_order);
    RUN_TEST(symbol_typed_declarations);
    RUN_TEST(symbol_final_variable);
    RUN_TEST(symbol_synthesized_type);
}
