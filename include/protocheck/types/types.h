#pragma once

#include "protocheck/types/symbol.h"
#include <llvm/ADT/StringRef.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace protocheck {
namespace types {

class ClassType;
class ModuleType;
class FunctionType;
class OverloadedFunctionType;
class TypeVarType;
class UnionType;

using ClassTypePtr = std::shared_ptr<const ClassType>;
using FunctionTypePtr = std::shared_ptr<const FunctionType>;
using TypeVarTypePtr = std::shared_ptr<const TypeVarType>;

// Past this depth nested comparisons give up and assume compatibility
constexpr int maxTypeRecursionCount = 14;

// Closed set of type variants. Code that inspects a type switches on the
// category and casts to the matching class.
enum class TypeCategory {
    Unknown,
    Any,
    None,
    Class,
    Module,
    Function,
    OverloadedFunction,
    TypeVar,
    Union
};

class Type {
public:
    virtual ~Type() = default;

    TypeCategory getCategory() const { return category_; }

protected:
    explicit Type(TypeCategory category) : category_(category) {}

private:
    TypeCategory category_;
};

class UnknownType : public Type {
public:
    UnknownType() : Type(TypeCategory::Unknown) {}
    static TypePtr create();
};

class AnyType : public Type {
public:
    AnyType() : Type(TypeCategory::Any) {}
    static TypePtr create();
};

// The None singleton (an instance)
class NoneType : public Type {
public:
    NoneType() : Type(TypeCategory::None) {}
    static TypePtr create();
};

namespace ClassTypeFlags {
    constexpr uint32_t None = 0;
    constexpr uint32_t BuiltInClass = 1 << 0;
    constexpr uint32_t ProtocolClass = 1 << 1;
    constexpr uint32_t TypedDictClass = 1 << 2;
    constexpr uint32_t PropertyClass = 1 << 3;
    constexpr uint32_t Final = 1 << 4;
}

// Declaration-level information shared by every specialization and view of a
// class. Owned by a TypeStore; class types refer to it without owning it.
struct ClassDetails {
    std::string name;
    std::string fullName;
    uint32_t flags = ClassTypeFlags::None;
    // Instantiable class types (possibly specialized in terms of this class's
    // type parameters) or Unknown for unresolved bases
    std::vector<TypePtr> baseClasses;
    // Linearized ancestors excluding the class itself, most specific first
    std::vector<TypePtr> mro;
    SymbolTable fields;
    std::vector<TypeVarTypePtr> typeParameters;
    TypePtr effectiveMetaclass;
    std::string typeVarScopeId;

    // Accessors of property classes
    FunctionTypePtr fget;
    FunctionTypePtr fset;
    FunctionTypePtr fdel;

    ClassDetails() = default;
    ClassDetails(const ClassDetails&) = delete;
    ClassDetails& operator=(const ClassDetails&) = delete;

    // Convenience for building class bodies
    Symbol* addField(const std::string& fieldName, std::unique_ptr<Symbol> symbol) {
        return fields.insert(fieldName, std::move(symbol));
    }
};

class ClassType : public Type {
public:
    ClassType(ClassDetails* details, bool isInstance,
              std::optional<std::vector<TypePtr>> typeArguments = std::nullopt,
              bool isTypeArgumentExplicit = false,
              std::optional<std::string> literalValue = std::nullopt)
        : Type(TypeCategory::Class), details_(details), isInstance_(isInstance),
          typeArguments_(std::move(typeArguments)), isTypeArgumentExplicit_(isTypeArgumentExplicit),
          literalValue_(std::move(literalValue)) {}

    static ClassTypePtr createInstantiable(ClassDetails* details);
    static ClassTypePtr createInstance(ClassDetails* details);

    static ClassTypePtr cloneAsInstance(const ClassType& classType);
    static ClassTypePtr cloneAsInstantiable(const ClassType& classType);
    static ClassTypePtr cloneForSpecialization(const ClassType& classType,
                                               std::optional<std::vector<TypePtr>> typeArguments,
                                               bool isTypeArgumentExplicit);
    static ClassTypePtr cloneWithLiteral(const ClassType& classType, std::optional<std::string> literalValue);

    // Both refer to the same class declaration, regardless of specialization
    static bool isSameGenericClass(const ClassType& a, const ClassType& b) { return a.details_ == b.details_; }

    const ClassDetails& getDetails() const { return *details_; }
    ClassDetails* getDetailsPtr() const { return details_; }

    bool isInstance() const { return isInstance_; }
    bool isInstantiable() const { return !isInstance_; }

    const std::optional<std::vector<TypePtr>>& getTypeArguments() const { return typeArguments_; }
    bool isTypeArgumentExplicit() const { return isTypeArgumentExplicit_; }
    const std::optional<std::string>& getLiteralValue() const { return literalValue_; }

    bool isProtocolClass() const { return (details_->flags & ClassTypeFlags::ProtocolClass) != 0; }
    bool isTypedDictClass() const { return (details_->flags & ClassTypeFlags::TypedDictClass) != 0; }
    bool isPropertyClass() const { return (details_->flags & ClassTypeFlags::PropertyClass) != 0; }
    bool isFinal() const { return (details_->flags & ClassTypeFlags::Final) != 0; }
    bool isBuiltIn(llvm::StringRef name = "") const;

private:
    ClassDetails* details_;
    bool isInstance_;
    std::optional<std::vector<TypePtr>> typeArguments_;
    bool isTypeArgumentExplicit_;
    std::optional<std::string> literalValue_;
};

class ModuleType : public Type {
public:
    ModuleType(const std::string& name, const SymbolTable* fields)
        : Type(TypeCategory::Module), name_(name), fields_(fields) {}

    static TypePtr create(const std::string& name, const SymbolTable* fields);

    const std::string& getName() const { return name_; }
    const SymbolTable& getFields() const { return *fields_; }

private:
    std::string name_;
    const SymbolTable* fields_;
};

enum class ParameterCategory {
    Simple,
    ArgsList,   // *args
    KwargsDict  // **kwargs
};

struct FunctionParam {
    ParameterCategory category = ParameterCategory::Simple;
    std::string name;
    TypePtr type;  // nullptr if not annotated
    bool hasDefault = false;

    FunctionParam() = default;
    FunctionParam(const std::string& paramName, TypePtr paramType, bool withDefault = false,
                  ParameterCategory paramCategory = ParameterCategory::Simple)
        : category(paramCategory), name(paramName), type(std::move(paramType)), hasDefault(withDefault) {}

    // Dunder-prefixed names that aren't dunder methods are positional-only
    bool isPositionalOnly() const;
};

enum class MethodKind {
    Instance,
    Class,
    Static
};

class FunctionType : public Type {
public:
    using ReturnTypeInferrer = std::function<TypePtr()>;

    FunctionType(const std::string& name, std::vector<FunctionParam> params, TypePtr declaredReturnType,
                 MethodKind methodKind = MethodKind::Instance, const std::string& typeVarScopeId = "")
        : Type(TypeCategory::Function), name_(name), params_(std::move(params)),
          declaredReturnType_(std::move(declaredReturnType)), methodKind_(methodKind),
          typeVarScopeId_(typeVarScopeId) {}

    const std::string& getName() const { return name_; }
    const std::vector<FunctionParam>& getParams() const { return params_; }
    const TypePtr& getDeclaredReturnType() const { return declaredReturnType_; }
    MethodKind getMethodKind() const { return methodKind_; }
    const std::string& getTypeVarScopeId() const { return typeVarScopeId_; }

    // Return type computed on demand for functions without an annotation
    void setReturnTypeInferrer(ReturnTypeInferrer inferrer) { inferrer_ = std::move(inferrer); }
    const ReturnTypeInferrer& getReturnTypeInferrer() const { return inferrer_; }

    // No declared return type and the inferrer has not run yet
    bool isReturnTypeInferencePending() const;

    // Runs the inferrer once; later calls are no-ops
    void inferReturnType() const;

    // Declared, else inferred, else Unknown
    TypePtr getEffectiveReturnType() const;

    // Copy with replaced parameters and return type; keeps name, kind and scope
    static FunctionTypePtr cloneWithSignature(const FunctionType& function, std::vector<FunctionParam> params,
                                              TypePtr returnType);

private:
    std::string name_;
    std::vector<FunctionParam> params_;
    TypePtr declaredReturnType_;
    MethodKind methodKind_;
    std::string typeVarScopeId_;
    ReturnTypeInferrer inferrer_;
    mutable TypePtr inferredReturnType_;
    mutable bool isInferenceDone_ = false;
};

class OverloadedFunctionType : public Type {
public:
    explicit OverloadedFunctionType(std::vector<FunctionTypePtr> overloads)
        : Type(TypeCategory::OverloadedFunction), overloads_(std::move(overloads)) {}

    static TypePtr create(std::vector<FunctionTypePtr> overloads);

    const std::vector<FunctionTypePtr>& getOverloads() const { return overloads_; }

private:
    std::vector<FunctionTypePtr> overloads_;
};

enum class Variance {
    Invariant,
    Covariant,
    Contravariant
};

enum class ParamSpecAccess {
    None,
    Args,   // P.args
    Kwargs  // P.kwargs
};

class TypeVarType : public Type {
public:
    TypeVarType(const std::string& name, const std::string& scopeId, Variance variance = Variance::Invariant,
                TypePtr bound = nullptr)
        : Type(TypeCategory::TypeVar), name_(name), scopeId_(scopeId), variance_(variance),
          bound_(std::move(bound)) {}

    static TypeVarTypePtr create(const std::string& name, const std::string& scopeId,
                                 Variance variance = Variance::Invariant, TypePtr bound = nullptr);
    static TypeVarTypePtr createParamSpec(const std::string& name, const std::string& scopeId);
    // The implicit "Self" variable of a class; bound to an instance of the class
    static TypeVarTypePtr createSynthesizedSelf(const ClassType& classType);
    static TypeVarTypePtr cloneForParamSpecAccess(const TypeVarType& paramSpec, ParamSpecAccess access);

    const std::string& getName() const { return name_; }
    const std::string& getScopeId() const { return scopeId_; }
    Variance getVariance() const { return variance_; }
    const TypePtr& getBound() const { return bound_; }
    bool isSynthesizedSelf() const { return isSynthesizedSelf_; }
    bool isParamSpec() const { return isParamSpec_; }
    ParamSpecAccess getParamSpecAccess() const { return paramSpecAccess_; }

private:
    std::string name_;
    std::string scopeId_;
    Variance variance_;
    TypePtr bound_;
    bool isSynthesizedSelf_ = false;
    bool isParamSpec_ = false;
    ParamSpecAccess paramSpecAccess_ = ParamSpecAccess::None;
};

class UnionType : public Type {
public:
    explicit UnionType(std::vector<TypePtr> subtypes)
        : Type(TypeCategory::Union), subtypes_(std::move(subtypes)) {}

    const std::vector<TypePtr>& getSubtypes() const { return subtypes_; }

private:
    std::vector<TypePtr> subtypes_;
};

// Flattens nested unions and drops duplicates. Any or Unknown absorbs the
// union; a single remaining subtype is returned as is.
TypePtr combineTypes(const std::vector<TypePtr>& types);

// Category checks that tolerate nullptr
bool isClass(const TypePtr& type);
bool isClassInstance(const TypePtr& type);
bool isInstantiableClass(const TypePtr& type);
bool isFunction(const TypePtr& type);
bool isFunctionOrOverloaded(const TypePtr& type);
bool isAnyOrUnknown(const TypePtr& type);

// Unchecked downcasts; the caller has tested the category
ClassTypePtr asClass(const TypePtr& type);
FunctionTypePtr asFunction(const TypePtr& type);
std::shared_ptr<const OverloadedFunctionType> asOverloaded(const TypePtr& type);
TypeVarTypePtr asTypeVar(const TypePtr& type);
std::shared_ptr<const UnionType> asUnion(const TypePtr& type);
std::shared_ptr<const ModuleType> asModule(const TypePtr& type);

// Structural identity. A missing type argument matches Unknown.
bool isTypeSame(const TypePtr& type1, const TypePtr& type2, int recursionCount = 0);

// Human-readable rendering used in diagnostics
std::string printType(const TypePtr& type);

} // namespace types
} // namespace protocheck
