#pragma once

#include "protocheck/types/types.h"
#include <memory>
#include <string>
#include <vector>

namespace protocheck {
namespace types {

// Owns class declarations and module symbol tables for one checking session.
// Everything handed out stays valid until the store is destroyed.
class TypeStore {
public:
    TypeStore() = default;
    TypeStore(const TypeStore&) = delete;
    TypeStore& operator=(const TypeStore&) = delete;

    // New class declaration with a unique type variable scope id
    ClassDetails* createClassDetails(const std::string& name, uint32_t flags = ClassTypeFlags::None,
                                     const std::string& moduleName = "");

    SymbolTable* createSymbolTable();

    // Scope id for a function's own type parameters
    std::string createFunctionScopeId(const std::string& functionName);

    size_t getClassCount() const { return classes_.size(); }

private:
    std::vector<std::unique_ptr<ClassDetails>> classes_;
    std::vector<std::unique_ptr<SymbolTable>> symbolTables_;
    unsigned nextScopeId_ = 0;
};

} // namespace types
} // namespace protocheck
