#pragma once

#include "protocheck/types/type_store.h"
#include "protocheck/types/types.h"
#include <string>
#include <vector>

namespace protocheck {
namespace types {

// Canonical builtin classes of one checking session. All members are
// instantiable class types.
struct BuiltinTypes {
    ClassTypePtr objectClass;
    ClassTypePtr typeClass;
    ClassTypePtr intClass;
    ClassTypePtr floatClass;
    ClassTypePtr complexClass;
    ClassTypePtr strClass;
    ClassTypePtr boolClass;
    ClassTypePtr propertyClass;
    ClassTypePtr protocolClass;
    ClassTypePtr genericClass;
    // Stand-in for TypedDict classes in protocol matching
    ClassTypePtr typedDictPlaceholder;

    static BuiltinTypes create(TypeStore& store);

    // New class with no bases yet. Type parameters are added with
    // addTypeParameter before finalizeClass fixes the bases and the MRO.
    ClassTypePtr createClass(TypeStore& store, const std::string& name,
                             uint32_t flags = ClassTypeFlags::None) const;

    // Type variable scoped to the class, appended to its type parameters
    TypeVarTypePtr addTypeParameter(const ClassType& classType, const std::string& name,
                                    Variance variance = Variance::Invariant, TypePtr bound = nullptr) const;

    // Sets the bases (object if empty) and the metaclass, which is inherited
    // from the first class base unless given, then computes the MRO
    void finalizeClass(const ClassType& classType, std::vector<TypePtr> bases = {}, TypePtr metaclass = nullptr) const;

    // createClass followed by finalizeClass, for non-generic classes
    ClassTypePtr declareClass(TypeStore& store, const std::string& name, std::vector<TypePtr> bases = {},
                              uint32_t flags = ClassTypeFlags::None, TypePtr metaclass = nullptr) const;

    // Non-generic protocol; Protocol is appended to the bases
    ClassTypePtr declareProtocol(TypeStore& store, const std::string& name, std::vector<TypePtr> bases = {}) const;

    // Property object wrapping the given accessors
    ClassTypePtr createProperty(TypeStore& store, FunctionTypePtr fget, FunctionTypePtr fset = nullptr,
                                FunctionTypePtr fdel = nullptr) const;

    TypePtr objectInstance() const { return ClassType::cloneAsInstance(*objectClass); }
    TypePtr intInstance() const { return ClassType::cloneAsInstance(*intClass); }
    TypePtr floatInstance() const { return ClassType::cloneAsInstance(*floatClass); }
    TypePtr strInstance() const { return ClassType::cloneAsInstance(*strClass); }
    TypePtr boolInstance() const { return ClassType::cloneAsInstance(*boolClass); }
};

} // namespace types
} // namespace protocheck
