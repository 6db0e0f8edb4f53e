#include "protocheck/types/type_utils.h"
#include <algorithm>
#include <deque>

namespace protocheck {
namespace types {

std::string getTypeVarScopeId(const TypePtr& type) {
    if (!type) {
        return "";
    }
    switch (type->getCategory()) {
        case TypeCategory::Class:
            return asClass(type)->getDetails().typeVarScopeId;
        case TypeCategory::Function:
            return asFunction(type)->getTypeVarScopeId();
        case TypeCategory::TypeVar:
            return asTypeVar(type)->getScopeId();
        default:
            return "";
    }
}

static TypePtr applySolvedTypeVarsRecursive(const TypePtr& type, const TypeVarContext& context,
                                            bool unknownIfNotFound, int recursionCount);

static FunctionTypePtr applySolvedTypeVarsToFunction(const FunctionType& function, const TypeVarContext& context,
                                                     bool unknownIfNotFound, int recursionCount) {
    std::vector<FunctionParam> params;
    params.reserve(function.getParams().size());
    for (const FunctionParam& param : function.getParams()) {
        FunctionParam specialized = param;
        if (param.type) {
            specialized.type = applySolvedTypeVarsRecursive(param.type, context, unknownIfNotFound, recursionCount);
        }
        params.push_back(std::move(specialized));
    }

    TypePtr returnType;
    if (function.getDeclaredReturnType()) {
        returnType = applySolvedTypeVarsRecursive(function.getDeclaredReturnType(), context, unknownIfNotFound,
                                                  recursionCount);
    } else if (function.getReturnTypeInferrer() && !function.isReturnTypeInferencePending()) {
        returnType = applySolvedTypeVarsRecursive(function.getEffectiveReturnType(), context, unknownIfNotFound,
                                                  recursionCount);
    }
    return FunctionType::cloneWithSignature(function, std::move(params), std::move(returnType));
}

static TypePtr applySolvedTypeVarsRecursive(const TypePtr& type, const TypeVarContext& context,
                                            bool unknownIfNotFound, int recursionCount) {
    if (!type || recursionCount > maxTypeRecursionCount) {
        return type;
    }
    recursionCount++;

    switch (type->getCategory()) {
        case TypeCategory::Unknown:
        case TypeCategory::Any:
        case TypeCategory::None:
        case TypeCategory::Module:
            return type;

        case TypeCategory::TypeVar: {
            const TypeVarType& typeVar = *asTypeVar(type);
            if (typeVar.getParamSpecAccess() != ParamSpecAccess::None) {
                return type;
            }
            if (context.hasSolveForScope(typeVar.getScopeId())) {
                if (TypePtr replacement = context.getTypeVarType(typeVar)) {
                    return replacement;
                }
                if (unknownIfNotFound) {
                    return UnknownType::create();
                }
            }
            return type;
        }

        case TypeCategory::Class: {
            const ClassType& classType = *asClass(type);
            if (classType.getTypeArguments()) {
                std::vector<TypePtr> typeArgs;
                for (const TypePtr& typeArg : *classType.getTypeArguments()) {
                    typeArgs.push_back(applySolvedTypeVarsRecursive(typeArg, context, unknownIfNotFound, recursionCount));
                }
                return ClassType::cloneForSpecialization(classType, std::move(typeArgs),
                                                         classType.isTypeArgumentExplicit());
            }

            // An unspecialized generic class is specialized by its own parameters
            const auto& typeParams = classType.getDetails().typeParameters;
            if (!typeParams.empty() && context.hasSolveForScope(classType.getDetails().typeVarScopeId)) {
                std::vector<TypePtr> typeArgs;
                for (const TypeVarTypePtr& typeParam : typeParams) {
                    typeArgs.push_back(applySolvedTypeVarsRecursive(typeParam, context, unknownIfNotFound, recursionCount));
                }
                return ClassType::cloneForSpecialization(classType, std::move(typeArgs), true);
            }
            return type;
        }

        case TypeCategory::Function:
            return applySolvedTypeVarsToFunction(*asFunction(type), context, unknownIfNotFound, recursionCount);

        case TypeCategory::OverloadedFunction: {
            std::vector<FunctionTypePtr> overloads;
            for (const FunctionTypePtr& overload : asOverloaded(type)->getOverloads()) {
                overloads.push_back(applySolvedTypeVarsToFunction(*overload, context, unknownIfNotFound, recursionCount));
            }
            return OverloadedFunctionType::create(std::move(overloads));
        }

        case TypeCategory::Union: {
            std::vector<TypePtr> subtypes;
            for (const TypePtr& subtype : asUnion(type)->getSubtypes()) {
                subtypes.push_back(applySolvedTypeVarsRecursive(subtype, context, unknownIfNotFound, recursionCount));
            }
            return combineTypes(subtypes);
        }
    }
    return type;
}

TypePtr applySolvedTypeVars(const TypePtr& type, const TypeVarContext& context, bool unknownIfNotFound) {
    if (context.isEmpty() && !unknownIfNotFound) {
        return type;
    }
    return applySolvedTypeVarsRecursive(type, context, unknownIfNotFound, 0);
}

TypeVarContext buildTypeVarContextFromSpecializedClass(const ClassType& classType) {
    const ClassDetails& details = classType.getDetails();
    TypeVarContext context(details.typeVarScopeId);
    if (classType.getTypeArguments()) {
        const auto& typeArgs = *classType.getTypeArguments();
        for (size_t i = 0; i < details.typeParameters.size(); ++i) {
            context.setTypeVarType(*details.typeParameters[i],
                                   i < typeArgs.size() ? typeArgs[i] : UnknownType::create());
        }
    }
    return context;
}

TypePtr partiallySpecializeType(const TypePtr& type, const ClassType& contextClass, const ClassTypePtr& selfClass) {
    if (!contextClass.getTypeArguments() && !selfClass) {
        return type;
    }
    TypeVarContext context = buildTypeVarContextFromSpecializedClass(contextClass);
    if (selfClass) {
        populateTypeVarContextForSelfType(context, contextClass, *selfClass);
    }
    return applySolvedTypeVars(type, context);
}

void populateTypeVarContextForSelfType(TypeVarContext& context, const ClassType& contextClass,
                                       const ClassType& selfClass) {
    TypeVarTypePtr selfTypeVar = TypeVarType::createSynthesizedSelf(contextClass);
    context.addSolveForScope(selfTypeVar->getScopeId());
    context.setTypeVarType(*selfTypeVar, ClassType::cloneAsInstance(selfClass));
}

ClassTypePtr specializeForBaseClass(const ClassType& srcType, const ClassTypePtr& baseClass) {
    if (!baseClass->getTypeArguments()) {
        return baseClass;
    }
    TypeVarContext context = buildTypeVarContextFromSpecializedClass(srcType);
    return asClass(applySolvedTypeVars(baseClass, context));
}

static bool containsLiteralTypeRecursive(const TypePtr& type, bool includeTypeArgs, int recursionCount) {
    if (!type || recursionCount > maxTypeRecursionCount) {
        return false;
    }
    recursionCount++;

    if (type->getCategory() == TypeCategory::Union) {
        for (const TypePtr& subtype : asUnion(type)->getSubtypes()) {
            if (containsLiteralTypeRecursive(subtype, includeTypeArgs, recursionCount)) {
                return true;
            }
        }
        return false;
    }

    if (!isClass(type)) {
        return false;
    }
    const ClassType& classType = *asClass(type);
    if (classType.isInstance() && classType.getLiteralValue()) {
        return true;
    }
    if (includeTypeArgs && classType.getTypeArguments()) {
        for (const TypePtr& typeArg : *classType.getTypeArguments()) {
            if (containsLiteralTypeRecursive(typeArg, includeTypeArgs, recursionCount)) {
                return true;
            }
        }
    }
    return false;
}

bool containsLiteralType(const TypePtr& type, bool includeTypeArgs) {
    return containsLiteralTypeRecursive(type, includeTypeArgs, 0);
}

static bool isParamSpecAccessParam(const FunctionParam& param, ParameterCategory category, ParamSpecAccess access) {
    if (param.category != category || !param.type || param.type->getCategory() != TypeCategory::TypeVar) {
        return false;
    }
    return asTypeVar(param.type)->getParamSpecAccess() == access;
}

TypePtr removeParamSpecVariadicsFromSignature(const TypePtr& type) {
    if (!isFunction(type)) {
        return type;
    }
    const FunctionType& function = *asFunction(type);
    const auto& params = function.getParams();
    if (params.size() < 2) {
        return type;
    }
    const FunctionParam& argsParam = params[params.size() - 2];
    const FunctionParam& kwargsParam = params[params.size() - 1];
    if (!isParamSpecAccessParam(argsParam, ParameterCategory::ArgsList, ParamSpecAccess::Args) ||
        !isParamSpecAccessParam(kwargsParam, ParameterCategory::KwargsDict, ParamSpecAccess::Kwargs)) {
        return type;
    }

    std::vector<FunctionParam> remaining(params.begin(), params.end() - 2);
    return FunctionType::cloneWithSignature(function, std::move(remaining), function.getDeclaredReturnType());
}

llvm::SmallVector<TypePtr, 8> getMroClasses(const ClassType& classType) {
    llvm::SmallVector<TypePtr, 8> mroClasses;
    mroClasses.push_back(ClassType::cloneAsInstantiable(classType));
    for (const TypePtr& mroClass : classType.getDetails().mro) {
        if (isInstantiableClass(mroClass)) {
            mroClasses.push_back(partiallySpecializeType(mroClass, classType));
        } else {
            mroClasses.push_back(mroClass);
        }
    }
    return mroClasses;
}

std::optional<ClassMember> lookUpClassMember(const TypePtr& classType, llvm::StringRef memberName) {
    if (!isClass(classType)) {
        return std::nullopt;
    }

    for (const TypePtr& mroClass : getMroClasses(*asClass(classType))) {
        if (!isInstantiableClass(mroClass)) {
            // Deriving from an unknown type; any member could exist
            static const std::unique_ptr<Symbol> unknownSymbol =
                Symbol::createWithType(SymbolFlags::None, UnknownType::create());
            ClassMember member;
            member.symbol = unknownSymbol.get();
            member.classType = UnknownType::create();
            return member;
        }

        const Symbol* symbol = asClass(mroClass)->getDetails().fields.lookup(memberName);
        if (!symbol) {
            continue;
        }
        if (symbol->isInstanceMember()) {
            ClassMember member;
            member.symbol = symbol;
            member.classType = mroClass;
            member.isInstanceMember = true;
            return member;
        }
        if (symbol->isClassMember()) {
            ClassMember member;
            member.symbol = symbol;
            member.classType = mroClass;
            member.isClassVar = symbol->isClassVar();
            return member;
        }
    }
    return std::nullopt;
}

static bool isSameMroEntry(const TypePtr& entry, const TypePtr& other) {
    if (isInstantiableClass(entry) && isInstantiableClass(other)) {
        return ClassType::isSameGenericClass(*asClass(entry), *asClass(other));
    }
    return false;
}

bool computeMroLinearization(const ClassType& classType) {
    ClassDetails* details = classType.getDetailsPtr();
    details->mro.clear();

    std::vector<std::deque<TypePtr>> classLists;
    for (const TypePtr& baseClass : details->baseClasses) {
        std::deque<TypePtr> classList;
        if (isInstantiableClass(baseClass)) {
            for (const TypePtr& mroClass : getMroClasses(*asClass(baseClass))) {
                classList.push_back(mroClass);
            }
        } else {
            classList.push_back(UnknownType::create());
        }
        classLists.push_back(std::move(classList));
    }
    classLists.emplace_back(details->baseClasses.begin(), details->baseClasses.end());

    auto isInTail = [&classLists](const TypePtr& candidate) {
        for (const auto& classList : classLists) {
            for (size_t i = 1; i < classList.size(); ++i) {
                if (isSameMroEntry(classList[i], candidate)) {
                    return true;
                }
            }
        }
        return false;
    };

    while (true) {
        classLists.erase(std::remove_if(classLists.begin(), classLists.end(),
                                        [](const std::deque<TypePtr>& classList) { return classList.empty(); }),
                         classLists.end());
        if (classLists.empty()) {
            return true;
        }

        bool foundHead = false;
        for (auto& classList : classLists) {
            TypePtr head = classList.front();
            if (!isInstantiableClass(head)) {
                details->mro.push_back(head);
                for (auto& other : classLists) {
                    if (!other.empty() && other.front() == head) {
                        other.pop_front();
                    }
                }
                foundHead = true;
                break;
            }
            if (!isInTail(head)) {
                details->mro.push_back(head);
                for (auto& other : classLists) {
                    if (!other.empty() && isSameMroEntry(other.front(), head)) {
                        other.pop_front();
                    }
                }
                foundHead = true;
                break;
            }
        }

        if (!foundHead) {
            // Inconsistent hierarchy; keep every remaining class once
            for (const auto& classList : classLists) {
                for (const TypePtr& entry : classList) {
                    bool isDuplicate = false;
                    for (const TypePtr& existing : details->mro) {
                        if (isSameMroEntry(existing, entry) || existing == entry) {
                            isDuplicate = true;
                            break;
                        }
                    }
                    if (!isDuplicate) {
                        details->mro.push_back(entry);
                    }
                }
            }
            return false;
        }
    }
}

bool derivesFromClass(const ClassType& classType, const ClassType& ancestor) {
    for (const TypePtr& mroClass : getMroClasses(classType)) {
        if (isClass(mroClass) && ClassType::isSameGenericClass(*asClass(mroClass), ancestor)) {
            return true;
        }
    }
    return false;
}

} // namespace types
} // namespace protocheck
