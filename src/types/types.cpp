#include "protocheck/types/types.h"
#include <llvm/Support/raw_ostream.h>
#include <algorithm>

namespace protocheck {
namespace types {

TypePtr UnknownType::create() {
    static const TypePtr instance = std::make_shared<UnknownType>();
    return instance;
}

TypePtr AnyType::create() {
    static const TypePtr instance = std::make_shared<AnyType>();
    return instance;
}

TypePtr NoneType::create() {
    static const TypePtr instance = std::make_shared<NoneType>();
    return instance;
}

ClassTypePtr ClassType::createInstantiable(ClassDetails* details) {
    return std::make_shared<ClassType>(details, false);
}

ClassTypePtr ClassType::createInstance(ClassDetails* details) {
    return std::make_shared<ClassType>(details, true);
}

ClassTypePtr ClassType::cloneAsInstance(const ClassType& classType) {
    return std::make_shared<ClassType>(classType.details_, true, classType.typeArguments_,
                                       classType.isTypeArgumentExplicit_, classType.literalValue_);
}

ClassTypePtr ClassType::cloneAsInstantiable(const ClassType& classType) {
    return std::make_shared<ClassType>(classType.details_, false, classType.typeArguments_,
                                       classType.isTypeArgumentExplicit_, classType.literalValue_);
}

ClassTypePtr ClassType::cloneForSpecialization(const ClassType& classType,
                                               std::optional<std::vector<TypePtr>> typeArguments,
                                               bool isTypeArgumentExplicit) {
    return std::make_shared<ClassType>(classType.details_, classType.isInstance_, std::move(typeArguments),
                                       isTypeArgumentExplicit, classType.literalValue_);
}

ClassTypePtr ClassType::cloneWithLiteral(const ClassType& classType, std::optional<std::string> literalValue) {
    return std::make_shared<ClassType>(classType.details_, classType.isInstance_, classType.typeArguments_,
                                       classType.isTypeArgumentExplicit_, std::move(literalValue));
}

bool ClassType::isBuiltIn(llvm::StringRef name) const {
    if ((details_->flags & ClassTypeFlags::BuiltInClass) == 0) {
        return false;
    }
    return name.empty() || details_->name == name;
}

TypePtr ModuleType::create(const std::string& name, const SymbolTable* fields) {
    return std::make_shared<ModuleType>(name, fields);
}

bool FunctionParam::isPositionalOnly() const {
    llvm::StringRef ref(name);
    return ref.startswith("__") && !ref.endswith("__");
}

bool FunctionType::isReturnTypeInferencePending() const {
    return !declaredReturnType_ && inferrer_ && !isInferenceDone_;
}

void FunctionType::inferReturnType() const {
    if (declaredReturnType_ || isInferenceDone_) {
        return;
    }
    isInferenceDone_ = true;
    if (inferrer_) {
        inferredReturnType_ = inferrer_();
    }
}

TypePtr FunctionType::getEffectiveReturnType() const {
    if (declaredReturnType_) {
        return declaredReturnType_;
    }
    if (inferredReturnType_) {
        return inferredReturnType_;
    }
    return UnknownType::create();
}

FunctionTypePtr FunctionType::cloneWithSignature(const FunctionType& function, std::vector<FunctionParam> params,
                                                 TypePtr returnType) {
    auto clone = std::make_shared<FunctionType>(function.name_, std::move(params), std::move(returnType),
                                                function.methodKind_, function.typeVarScopeId_);
    if (!clone->declaredReturnType_) {
        // The clone shares the original's inference state
        clone->inferrer_ = function.inferrer_;
        clone->inferredReturnType_ = function.inferredReturnType_;
        clone->isInferenceDone_ = function.isInferenceDone_;
    }
    return clone;
}

TypePtr OverloadedFunctionType::create(std::vector<FunctionTypePtr> overloads) {
    return std::make_shared<OverloadedFunctionType>(std::move(overloads));
}

TypeVarTypePtr TypeVarType::create(const std::string& name, const std::string& scopeId, Variance variance,
                                   TypePtr bound) {
    return std::make_shared<TypeVarType>(name, scopeId, variance, std::move(bound));
}

TypeVarTypePtr TypeVarType::createParamSpec(const std::string& name, const std::string& scopeId) {
    auto paramSpec = std::make_shared<TypeVarType>(name, scopeId);
    paramSpec->isParamSpec_ = true;
    return paramSpec;
}

TypeVarTypePtr TypeVarType::createSynthesizedSelf(const ClassType& classType) {
    const ClassDetails& details = classType.getDetails();
    TypePtr bound = ClassType::cloneAsInstance(
        *ClassType::cloneForSpecialization(classType, std::nullopt, false));
    auto selfType = std::make_shared<TypeVarType>("Self@" + details.name, details.typeVarScopeId,
                                                  Variance::Invariant, bound);
    selfType->isSynthesizedSelf_ = true;
    return selfType;
}

TypeVarTypePtr TypeVarType::cloneForParamSpecAccess(const TypeVarType& paramSpec, ParamSpecAccess access) {
    auto clone = std::make_shared<TypeVarType>(paramSpec);
    clone->paramSpecAccess_ = access;
    return clone;
}

bool isClass(const TypePtr& type) {
    return type && type->getCategory() == TypeCategory::Class;
}

bool isClassInstance(const TypePtr& type) {
    return isClass(type) && static_cast<const ClassType&>(*type).isInstance();
}

bool isInstantiableClass(const TypePtr& type) {
    return isClass(type) && static_cast<const ClassType&>(*type).isInstantiable();
}

bool isFunction(const TypePtr& type) {
    return type && type->getCategory() == TypeCategory::Function;
}

bool isFunctionOrOverloaded(const TypePtr& type) {
    return type && (type->getCategory() == TypeCategory::Function ||
                    type->getCategory() == TypeCategory::OverloadedFunction);
}

bool isAnyOrUnknown(const TypePtr& type) {
    return !type || type->getCategory() == TypeCategory::Any || type->getCategory() == TypeCategory::Unknown;
}

ClassTypePtr asClass(const TypePtr& type) {
    return std::static_pointer_cast<const ClassType>(type);
}

FunctionTypePtr asFunction(const TypePtr& type) {
    return std::static_pointer_cast<const FunctionType>(type);
}

std::shared_ptr<const OverloadedFunctionType> asOverloaded(const TypePtr& type) {
    return std::static_pointer_cast<const OverloadedFunctionType>(type);
}

TypeVarTypePtr asTypeVar(const TypePtr& type) {
    return std::static_pointer_cast<const TypeVarType>(type);
}

std::shared_ptr<const UnionType> asUnion(const TypePtr& type) {
    return std::static_pointer_cast<const UnionType>(type);
}

std::shared_ptr<const ModuleType> asModule(const TypePtr& type) {
    return std::static_pointer_cast<const ModuleType>(type);
}

TypePtr combineTypes(const std::vector<TypePtr>& types) {
    std::vector<TypePtr> flattened;
    for (const TypePtr& type : types) {
        if (!type) {
            continue;
        }
        if (type->getCategory() == TypeCategory::Any || type->getCategory() == TypeCategory::Unknown) {
            return type;
        }
        if (type->getCategory() == TypeCategory::Union) {
            for (const TypePtr& subtype : asUnion(type)->getSubtypes()) {
                flattened.push_back(subtype);
            }
        } else {
            flattened.push_back(type);
        }
    }

    std::vector<TypePtr> unique;
    for (const TypePtr& type : flattened) {
        bool isDuplicate = false;
        for (const TypePtr& existing : unique) {
            if (isTypeSame(existing, type)) {
                isDuplicate = true;
                break;
            }
        }
        if (!isDuplicate) {
            unique.push_back(type);
        }
    }

    if (unique.empty()) {
        return UnknownType::create();
    }
    if (unique.size() == 1) {
        return unique.front();
    }
    return std::make_shared<UnionType>(std::move(unique));
}

static bool isTypeArgumentListSame(const ClassType& class1, const ClassType& class2, int recursionCount) {
    static const std::vector<TypePtr> noArgs;
    const auto& args1 = class1.getTypeArguments() ? *class1.getTypeArguments() : noArgs;
    const auto& args2 = class2.getTypeArguments() ? *class2.getTypeArguments() : noArgs;
    size_t count = std::max(args1.size(), args2.size());
    for (size_t i = 0; i < count; ++i) {
        TypePtr arg1 = i < args1.size() ? args1[i] : UnknownType::create();
        TypePtr arg2 = i < args2.size() ? args2[i] : UnknownType::create();
        if (!isTypeSame(arg1, arg2, recursionCount)) {
            return false;
        }
    }
    return true;
}

bool isTypeSame(const TypePtr& type1, const TypePtr& type2, int recursionCount) {
    if (type1 == type2) {
        return true;
    }
    if (!type1 || !type2) {
        return false;
    }
    if (type1->getCategory() != type2->getCategory()) {
        return false;
    }
    if (recursionCount > maxTypeRecursionCount) {
        return true;
    }
    recursionCount++;

    switch (type1->getCategory()) {
        case TypeCategory::Unknown:
        case TypeCategory::Any:
        case TypeCategory::None:
            return true;

        case TypeCategory::Class: {
            const auto& class1 = static_cast<const ClassType&>(*type1);
            const auto& class2 = static_cast<const ClassType&>(*type2);
            if (!ClassType::isSameGenericClass(class1, class2) || class1.isInstance() != class2.isInstance()) {
                return false;
            }
            if (class1.getLiteralValue() != class2.getLiteralValue()) {
                return false;
            }
            return isTypeArgumentListSame(class1, class2, recursionCount);
        }

        case TypeCategory::Module: {
            const auto& module1 = static_cast<const ModuleType&>(*type1);
            const auto& module2 = static_cast<const ModuleType&>(*type2);
            return &module1.getFields() == &module2.getFields();
        }

        case TypeCategory::Function: {
            const auto& func1 = static_cast<const FunctionType&>(*type1);
            const auto& func2 = static_cast<const FunctionType&>(*type2);
            const auto& params1 = func1.getParams();
            const auto& params2 = func2.getParams();
            if (params1.size() != params2.size() || func1.getMethodKind() != func2.getMethodKind()) {
                return false;
            }
            for (size_t i = 0; i < params1.size(); ++i) {
                if (params1[i].category != params2[i].category || params1[i].name != params2[i].name) {
                    return false;
                }
                TypePtr paramType1 = params1[i].type ? params1[i].type : UnknownType::create();
                TypePtr paramType2 = params2[i].type ? params2[i].type : UnknownType::create();
                if (!isTypeSame(paramType1, paramType2, recursionCount)) {
                    return false;
                }
            }
            return isTypeSame(func1.getEffectiveReturnType(), func2.getEffectiveReturnType(), recursionCount);
        }

        case TypeCategory::OverloadedFunction: {
            const auto& overloads1 = static_cast<const OverloadedFunctionType&>(*type1).getOverloads();
            const auto& overloads2 = static_cast<const OverloadedFunctionType&>(*type2).getOverloads();
            if (overloads1.size() != overloads2.size()) {
                return false;
            }
            for (size_t i = 0; i < overloads1.size(); ++i) {
                if (!isTypeSame(overloads1[i], overloads2[i], recursionCount)) {
                    return false;
                }
            }
            return true;
        }

        case TypeCategory::TypeVar: {
            const auto& typeVar1 = static_cast<const TypeVarType&>(*type1);
            const auto& typeVar2 = static_cast<const TypeVarType&>(*type2);
            return typeVar1.getName() == typeVar2.getName() &&
                   typeVar1.getScopeId() == typeVar2.getScopeId() &&
                   typeVar1.getParamSpecAccess() == typeVar2.getParamSpecAccess();
        }

        case TypeCategory::Union: {
            const auto& subtypes1 = static_cast<const UnionType&>(*type1).getSubtypes();
            const auto& subtypes2 = static_cast<const UnionType&>(*type2).getSubtypes();
            if (subtypes1.size() != subtypes2.size()) {
                return false;
            }
            // Order-insensitive; unions never hold duplicates
            for (const TypePtr& subtype : subtypes1) {
                bool found = false;
                for (const TypePtr& other : subtypes2) {
                    if (isTypeSame(subtype, other, recursionCount)) {
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

static void printTypeList(llvm::raw_ostream& os, const std::vector<TypePtr>& types) {
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            os << ", ";
        }
        os << printType(types[i]);
    }
}

static void printFunction(llvm::raw_ostream& os, const FunctionType& function) {
    os << "(";
    const auto& params = function.getParams();
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            os << ", ";
        }
        const FunctionParam& param = params[i];
        if (param.category == ParameterCategory::ArgsList) {
            os << "*";
        } else if (param.category == ParameterCategory::KwargsDict) {
            os << "**";
        }
        os << param.name;
        if (param.type) {
            os << ": " << printType(param.type);
        }
        if (param.hasDefault) {
            os << " = ...";
        }
    }
    os << ") -> " << printType(function.getEffectiveReturnType());
}

std::string printType(const TypePtr& type) {
    if (!type) {
        return "Unknown";
    }

    std::string text;
    llvm::raw_string_ostream os(text);

    switch (type->getCategory()) {
        case TypeCategory::Unknown:
            os << "Unknown";
            break;

        case TypeCategory::Any:
            os << "Any";
            break;

        case TypeCategory::None:
            os << "None";
            break;

        case TypeCategory::Class: {
            const auto& classType = static_cast<const ClassType&>(*type);
            if (classType.isInstantiable()) {
                os << "type[";
            }
            if (classType.getLiteralValue()) {
                os << "Literal[" << *classType.getLiteralValue() << "]";
            } else {
                os << classType.getDetails().name;
                if (classType.getTypeArguments() && !classType.getTypeArguments()->empty()) {
                    os << "[";
                    printTypeList(os, *classType.getTypeArguments());
                    os << "]";
                }
            }
            if (classType.isInstantiable()) {
                os << "]";
            }
            break;
        }

        case TypeCategory::Module:
            os << "Module(\"" << static_cast<const ModuleType&>(*type).getName() << "\")";
            break;

        case TypeCategory::Function:
            printFunction(os, static_cast<const FunctionType&>(*type));
            break;

        case TypeCategory::OverloadedFunction: {
            os << "Overload[";
            const auto& overloads = static_cast<const OverloadedFunctionType&>(*type).getOverloads();
            for (size_t i = 0; i < overloads.size(); ++i) {
                if (i > 0) {
                    os << ", ";
                }
                printFunction(os, *overloads[i]);
            }
            os << "]";
            break;
        }

        case TypeCategory::TypeVar: {
            const auto& typeVar = static_cast<const TypeVarType&>(*type);
            os << typeVar.getName();
            if (typeVar.getParamSpecAccess() == ParamSpecAccess::Args) {
                os << ".args";
            } else if (typeVar.getParamSpecAccess() == ParamSpecAccess::Kwargs) {
                os << ".kwargs";
            }
            break;
        }

        case TypeCategory::Union: {
            const auto& subtypes = static_cast<const UnionType&>(*type).getSubtypes();
            for (size_t i = 0; i < subtypes.size(); ++i) {
                if (i > 0) {
                    os << " | ";
                }
                os << printType(subtypes[i]);
            }
            break;
        }
    }

    os.flush();
    return text;
}

} // namespace types
} // namespace protocheck
