#include "protocheck/types/type_store.h"

namespace protocheck {
namespace types {

ClassDetails* TypeStore::createClassDetails(const std::string& name, uint32_t flags, const std::string& moduleName) {
    auto details = std::make_unique<ClassDetails>();
    details->name = name;
    details->fullName = moduleName.empty() ? name : moduleName + "." + name;
    details->flags = flags;
    details->typeVarScopeId = details->fullName + "." + std::to_string(nextScopeId_++);
    classes_.push_back(std::move(details));
    return classes_.back().get();
}

SymbolTable* TypeStore::createSymbolTable() {
    symbolTables_.push_back(std::make_unique<SymbolTable>());
    return symbolTables_.back().get();
}

std::string TypeStore::createFunctionScopeId(const std::string& functionName) {
    return functionName + "." + std::to_string(nextScopeId_++);
}

} // namespace types
} // namespace protocheck
