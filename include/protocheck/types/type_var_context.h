#pragma once

#include "protocheck/types/types.h"
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <string>

namespace protocheck {
namespace types {

// Solutions for type variables, keyed by name and scope. Only variables whose
// scope is one of the solve-for scopes are ever recorded or substituted.
class TypeVarContext {
public:
    TypeVarContext() = default;
    explicit TypeVarContext(const std::string& solveForScope);

    void addSolveForScope(const std::string& scopeId);
    bool hasSolveForScope(llvm::StringRef scopeId) const;
    const llvm::SmallVector<std::string, 2>& getSolveForScopes() const { return solveForScopes_; }

    void setTypeVarType(const TypeVarType& typeVar, TypePtr type);
    // nullptr if the variable has no solution
    TypePtr getTypeVarType(const TypeVarType& typeVar) const;

    bool isEmpty() const { return typeVarMap_.empty(); }
    size_t getSolutionCount() const { return typeVarMap_.size(); }

    TypeVarContext clone() const { return *this; }
    // Replaces this context's contents with another's (used after a speculative attempt succeeds)
    void copyFromClone(const TypeVarContext& other) { *this = other; }

private:
    static std::string makeKey(const TypeVarType& typeVar);

    llvm::SmallVector<std::string, 2> solveForScopes_;
    llvm::StringMap<TypePtr> typeVarMap_;
};

} // namespace types
} // namespace protocheck
