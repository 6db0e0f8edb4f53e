#include "protocheck/types/type_var_context.h"

namespace protocheck {
namespace types {

TypeVarContext::TypeVarContext(const std::string& solveForScope) {
    addSolveForScope(solveForScope);
}

void TypeVarContext::addSolveForScope(const std::string& scopeId) {
    if (scopeId.empty() || hasSolveForScope(scopeId)) {
        return;
    }
    solveForScopes_.push_back(scopeId);
}

bool TypeVarContext::hasSolveForScope(llvm::StringRef scopeId) const {
    if (scopeId.empty()) {
        return false;
    }
    for (const auto& scope : solveForScopes_) {
        if (scope == scopeId) {
            return true;
        }
    }
    return false;
}

std::string TypeVarContext::makeKey(const TypeVarType& typeVar) {
    return typeVar.getName() + "@" + typeVar.getScopeId();
}

void TypeVarContext::setTypeVarType(const TypeVarType& typeVar, TypePtr type) {
    typeVarMap_[makeKey(typeVar)] = std::move(type);
}

TypePtr TypeVarContext::getTypeVarType(const TypeVarType& typeVar) const {
    auto it = typeVarMap_.find(makeKey(typeVar));
    if (it == typeVarMap_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace types
} // namespace protocheck
