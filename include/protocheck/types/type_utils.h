#pragma once

#include "protocheck/types/type_var_context.h"
#include "protocheck/types/types.h"
#include <llvm/ADT/SmallVector.h>
#include <optional>
#include <string>

namespace protocheck {
namespace types {

// A member found by walking a class's MRO
struct ClassMember {
    const Symbol* symbol = nullptr;
    // The MRO class that declares the member, specialized for the class that
    // was searched, or Unknown if the MRO contains an unresolved base
    TypePtr classType;
    bool isInstanceMember = false;
    bool isClassVar = false;
};

std::string getTypeVarScopeId(const TypePtr& type);

// Replaces every type variable of the context's solve-for scopes that has a
// solution. Unsolved variables are left alone unless unknownIfNotFound is set.
TypePtr applySolvedTypeVars(const TypePtr& type, const TypeVarContext& context, bool unknownIfNotFound = false);

// Maps each type parameter of the class to its type argument
TypeVarContext buildTypeVarContextFromSpecializedClass(const ClassType& classType);

// Specializes a member type declared in contextClass using contextClass's
// type arguments. If selfClass is given, "Self" is replaced with it as well.
TypePtr partiallySpecializeType(const TypePtr& type, const ClassType& contextClass,
                                const ClassTypePtr& selfClass = nullptr);

// Binds the synthesized "Self" of contextClass to an instance of selfClass
void populateTypeVarContextForSelfType(TypeVarContext& context, const ClassType& contextClass,
                                       const ClassType& selfClass);

// Expresses a base class of srcType in terms of srcType's type arguments
ClassTypePtr specializeForBaseClass(const ClassType& srcType, const ClassTypePtr& baseClass);

bool containsLiteralType(const TypePtr& type, bool includeTypeArgs = false);

// Drops trailing "*args: P.args, **kwargs: P.kwargs" from a signature
TypePtr removeParamSpecVariadicsFromSignature(const TypePtr& type);

// The class itself followed by its ancestors, each specialized for classType
llvm::SmallVector<TypePtr, 8> getMroClasses(const ClassType& classType);

std::optional<ClassMember> lookUpClassMember(const TypePtr& classType, llvm::StringRef memberName);

// Fills in details.mro with the C3 linearization of the class's bases. Returns
// false if the hierarchy cannot be linearized; the MRO is then a best-effort
// depth-first order.
bool computeMroLinearization(const ClassType& classType);

// True if classType derives from ancestor, comparing generic classes
bool derivesFromClass(const ClassType& classType, const ClassType& ancestor);

} // namespace types
} // namespace protocheck
