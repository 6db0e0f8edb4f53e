#pragma once

#include "protocheck/diagnostic.h"
#include "protocheck/types/type_utils.h"
#include "protocheck/types/type_var_context.h"
#include "protocheck/types/types.h"
#include <cstdint>

namespace protocheck {
namespace semantic {

namespace AssignTypeFlags {
    constexpr uint32_t Default = 0;
    // Require the source and destination to be the same type
    constexpr uint32_t EnforceInvariance = 1 << 0;
    // Solve type variables that appear in the source rather than the destination
    constexpr uint32_t ReverseTypeVarMatching = 1 << 1;
    // Keep literal types when solving type variables instead of widening them
    constexpr uint32_t RetainLiteralsForTypeVar = 1 << 2;
}

// Type evaluation services the protocol matcher depends on. Every diag
// parameter may be null; typeVarContext may be null where noted.
class TypeEvaluator {
public:
    virtual ~TypeEvaluator() = default;

    virtual bool assignType(const types::TypePtr& destType, const types::TypePtr& srcType, DiagnosticAddendum* diag,
                            types::TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) = 0;

    // Binds a method to a class or instance, dropping the receiver parameter.
    // firstParamType overrides the receiver type used for the first parameter.
    // Returns nullptr if the receiver is incompatible with the first parameter.
    virtual types::TypePtr bindFunctionToClassOrObject(const types::TypePtr& baseType,
                                                       const types::TypePtr& memberType,
                                                       const types::ClassTypePtr& memberClass, int recursionCount,
                                                       bool treatConstructorAsClassMember = false,
                                                       const types::TypePtr& firstParamType = nullptr) = 0;

    virtual void inferReturnTypeIfNecessary(const types::TypePtr& type) = 0;

    // destOwner and srcOwner are the classes that declare the two properties
    virtual bool assignProperty(const types::ClassTypePtr& destPropertyType,
                                const types::ClassTypePtr& srcPropertyType, const types::ClassType& destOwner,
                                const types::ClassType& srcOwner, DiagnosticAddendum* diag,
                                types::TypeVarContext* typeVarContext,
                                const types::TypeVarContext* selfTypeVarContext, int recursionCount) = 0;

    virtual types::TypePtr getGetterTypeFromProperty(const types::ClassType& propertyClass, bool inferTypeIfNeeded) = 0;

    // Checks each type argument of srcType against destType according to the
    // variance of the corresponding type parameter
    virtual bool verifyTypeArgumentsAssignable(const types::ClassType& destType, const types::ClassType& srcType,
                                               DiagnosticAddendum* diag, types::TypeVarContext* typeVarContext,
                                               uint32_t flags, int recursionCount) = 0;

    // Placeholder class substituted for TypedDict classes, or nullptr
    virtual types::ClassTypePtr getTypedDictClassType() = 0;

    // nullptr if the symbol has no typed declaration
    virtual types::TypePtr getDeclaredTypeOfSymbol(const types::Symbol& symbol) = 0;
    virtual types::TypePtr getEffectiveTypeOfSymbol(const types::Symbol& symbol) = 0;
    virtual types::TypePtr getTypeOfMember(const types::ClassMember& member) = 0;
};

} // namespace semantic
} // namespace protocheck
