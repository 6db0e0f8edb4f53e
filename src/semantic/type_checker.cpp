#include "protocheck/semantic/type_checker.h"
#include <algorithm>
#include <iostream>

namespace protocheck {
namespace semantic {

using types::ClassType;
using types::ClassTypePtr;
using types::FunctionParam;
using types::FunctionType;
using types::FunctionTypePtr;
using types::ParameterCategory;
using types::TypeCategory;
using types::TypePtr;
using types::TypeVarContext;
using types::TypeVarType;
using types::UnknownType;

TypeChecker::TypeChecker(ErrorReporter& errorReporter, types::TypeStore& typeStore)
    : errorReporter_(errorReporter)
    , typeStore_(typeStore)
    , builtins_(types::BuiltinTypes::create(typeStore)) {}

void TypeChecker::trace(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[TypeChecker] " << message << std::endl;
    }
}

void TypeChecker::addTypeMismatch(DiagnosticAddendum* diag, const TypePtr& srcType, const TypePtr& destType) {
    if (diag) {
        diag->addMessage(Messages::typeAssignmentMismatch().format(
            {{"sourceType", types::printType(srcType)}, {"destType", types::printType(destType)}}));
    }
}

bool TypeChecker::checkAssignment(const TypePtr& declaredType, const TypePtr& assignedType,
                                  const SourceLocation& location) {
    DiagnosticAddendum diag;
    if (assignType(declaredType, assignedType, &diag, nullptr, AssignTypeFlags::Default, 0)) {
        return true;
    }

    errorReporter_.error(location,
                         Messages::typeIncompatible().format({{"sourceType", types::printType(assignedType)},
                                                              {"destType", types::printType(declaredType)}}),
                         ErrorCode(ErrorCodes::TYPE_INCOMPATIBLE, "assignment"));
    errorReporter_.addNotes(diag, maxDiagnosticDepth_, maxDiagnosticLineCount_);
    return false;
}

bool TypeChecker::checkProtocolAssignment(const ClassTypePtr& protocolType, const TypePtr& candidateType,
                                          const SourceLocation& location) {
    DiagnosticAddendum diag;
    bool isCompatible = true;

    if (types::isClass(candidateType)) {
        ClassTypePtr candidateClass = types::asClass(candidateType);
        isCompatible = assignClassToProtocol(protocolType, candidateClass, &diag, nullptr, AssignTypeFlags::Default,
                                             candidateClass->isInstantiable(), 0);
        if (!isCompatible) {
            errorReporter_.error(location,
                                 Messages::protocolIncompatible().format(
                                     {{"sourceType", types::printType(candidateType)},
                                      {"destType", protocolType->getDetails().name}}),
                                 ErrorCode(ErrorCodes::PROTOCOL_MISMATCH, "protocol"));
        }
    } else if (candidateType && candidateType->getCategory() == TypeCategory::Module) {
        const types::ModuleType& module = *types::asModule(candidateType);
        trace("matching module '" + module.getName() + "' against protocol '" + protocolType->getDetails().name + "'");
        isCompatible = canAssignModuleToProtocol(*this, protocolType, module, &diag, nullptr,
                                                 AssignTypeFlags::Default, 0);
        if (!isCompatible) {
            errorReporter_.error(location,
                                 Messages::moduleProtocolIncompatible().format(
                                     {{"sourceType", module.getName()}, {"destType", protocolType->getDetails().name}}),
                                 ErrorCode(ErrorCodes::MODULE_PROTOCOL_MISMATCH, "protocol"));
        }
    } else {
        return checkAssignment(ClassType::cloneAsInstance(*protocolType), candidateType, location);
    }

    if (!isCompatible) {
        errorReporter_.addNotes(diag, maxDiagnosticDepth_, maxDiagnosticLineCount_);
    }
    return isCompatible;
}

bool TypeChecker::validateProtocolTypeParamVariance(const ClassTypePtr& protocolClass,
                                                    const SourceLocation& location) {
    const auto& typeParams = protocolClass->getDetails().typeParameters;
    if (!protocolClass->isProtocolClass() || typeParams.empty()) {
        return true;
    }

    if (!varianceDummyClass_) {
        varianceDummyClass_ = builtins_.declareClass(typeStore_, "__varianceDummy");
    }
    TypePtr dummyObject = ClassType::cloneAsInstance(*varianceDummyClass_);
    ClassTypePtr genericProtocol =
        ClassType::cloneForSpecialization(*ClassType::cloneAsInstantiable(*protocolClass), std::nullopt, false);

    bool isValid = true;
    for (size_t paramIndex = 0; paramIndex < typeParams.size(); ++paramIndex) {
        const types::TypeVarTypePtr& param = typeParams[paramIndex];
        if (param->isParamSpec()) {
            continue;
        }

        // Every other parameter is pinned to the same dummy on both sides
        std::vector<TypePtr> srcTypeArgs;
        std::vector<TypePtr> destTypeArgs;
        for (size_t i = 0; i < typeParams.size(); ++i) {
            srcTypeArgs.push_back(i == paramIndex ? builtins_.objectInstance() : dummyObject);
            destTypeArgs.push_back(i == paramIndex ? TypePtr(typeParams[i]) : dummyObject);
        }
        ClassTypePtr srcType = ClassType::cloneForSpecialization(*genericProtocol, std::move(srcTypeArgs), true);
        ClassTypePtr destType = ClassType::cloneForSpecialization(*genericProtocol, std::move(destTypeArgs), true);

        types::Variance expectedVariance;
        if (canAssignProtocolClassToSelf(*this, srcType, destType)) {
            expectedVariance = types::Variance::Covariant;
        } else if (canAssignProtocolClassToSelf(*this, destType, srcType)) {
            expectedVariance = types::Variance::Contravariant;
        } else {
            expectedVariance = types::Variance::Invariant;
        }

        if (expectedVariance == param->getVariance()) {
            continue;
        }

        MessageTemplate::Params params = {{"variable", param->getName()},
                                          {"class", protocolClass->getDetails().name}};
        std::string message;
        switch (expectedVariance) {
            case types::Variance::Covariant:
                message = Messages::protocolVarianceCovariant().format(params);
                break;
            case types::Variance::Contravariant:
                message = Messages::protocolVarianceContravariant().format(params);
                break;
            case types::Variance::Invariant:
                message = Messages::protocolVarianceInvariant().format(params);
                break;
        }
        errorReporter_.warning(location, message, ErrorCode(ErrorCodes::PROTOCOL_VARIANCE, "variance"));
        isValid = false;
    }
    return isValid;
}

bool TypeChecker::assignClassToProtocol(const ClassTypePtr& destType, const ClassTypePtr& srcType,
                                        DiagnosticAddendum* diag, TypeVarContext* typeVarContext, uint32_t flags,
                                        bool treatSourceAsInstantiable, int recursionCount) {
    trace("matching " + types::printType(srcType) + " against protocol '" + destType->getDetails().name +
          "' (depth " + std::to_string(recursionCount) + ", pending " +
          std::to_string(protocolAssignmentStack_.size()) + ")");
    return canAssignClassToProtocol(*this, protocolAssignmentStack_, destType, srcType, diag, typeVarContext, flags,
                                    treatSourceAsInstantiable, recursionCount);
}

bool TypeChecker::assignType(const TypePtr& destType, const TypePtr& srcType, DiagnosticAddendum* diag,
                             TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) {
    if (recursionCount > types::maxTypeRecursionCount) {
        return true;
    }
    recursionCount++;

    if (!destType || !srcType || destType == srcType) {
        return true;
    }

    // Reverse matching solves variables that appear in the source
    if ((flags & AssignTypeFlags::ReverseTypeVarMatching) != 0 && srcType->getCategory() == TypeCategory::TypeVar) {
        const TypeVarType& srcTypeVar = *types::asTypeVar(srcType);
        if (typeVarContext && typeVarContext->hasSolveForScope(srcTypeVar.getScopeId())) {
            return assignTypeToTypeVar(srcTypeVar, destType, diag, *typeVarContext, flags, recursionCount);
        }
    }

    if (destType->getCategory() == TypeCategory::TypeVar) {
        const TypeVarType& destTypeVar = *types::asTypeVar(destType);
        if (types::isTypeSame(destType, srcType)) {
            return true;
        }
        if ((flags & AssignTypeFlags::ReverseTypeVarMatching) == 0 && typeVarContext &&
            typeVarContext->hasSolveForScope(destTypeVar.getScopeId())) {
            return assignTypeToTypeVar(destTypeVar, srcType, diag, *typeVarContext, flags, recursionCount);
        }
        if (types::isAnyOrUnknown(srcType)) {
            return true;
        }
        addTypeMismatch(diag, srcType, destType);
        return false;
    }

    if (types::isAnyOrUnknown(destType) || types::isAnyOrUnknown(srcType)) {
        return true;
    }

    if ((flags & AssignTypeFlags::EnforceInvariance) != 0) {
        return assignInvariant(destType, srcType, diag, typeVarContext, flags, recursionCount);
    }

    // A variable outside the solved scopes stands for its bound
    if (srcType->getCategory() == TypeCategory::TypeVar) {
        const TypePtr& bound = types::asTypeVar(srcType)->getBound();
        return assignType(destType, bound ? bound : builtins_.objectInstance(), diag, typeVarContext, flags,
                          recursionCount);
    }

    if (srcType->getCategory() == TypeCategory::Union) {
        bool isAssignable = true;
        for (const TypePtr& subtype : types::asUnion(srcType)->getSubtypes()) {
            if (!assignType(destType, subtype, createChildAddendum(diag), typeVarContext, flags, recursionCount)) {
                isAssignable = false;
            }
        }
        if (!isAssignable) {
            addTypeMismatch(diag, srcType, destType);
        }
        return isAssignable;
    }

    if (destType->getCategory() == TypeCategory::Union) {
        for (const TypePtr& subtype : types::asUnion(destType)->getSubtypes()) {
            if (!typeVarContext) {
                if (assignType(subtype, srcType, nullptr, nullptr, flags, recursionCount)) {
                    return true;
                }
                continue;
            }
            TypeVarContext attempt = typeVarContext->clone();
            if (assignType(subtype, srcType, nullptr, &attempt, flags, recursionCount)) {
                typeVarContext->copyFromClone(attempt);
                return true;
            }
        }
        addTypeMismatch(diag, srcType, destType);
        return false;
    }

    switch (destType->getCategory()) {
        case TypeCategory::None:
            if (srcType->getCategory() == TypeCategory::None) {
                return true;
            }
            break;

        case TypeCategory::Module:
            if (types::isTypeSame(destType, srcType)) {
                return true;
            }
            break;

        case TypeCategory::Class:
            return assignToClass(types::asClass(destType), srcType, diag, typeVarContext, flags, recursionCount);

        case TypeCategory::Function:
        case TypeCategory::OverloadedFunction:
            return assignToCallable(destType, srcType, diag, typeVarContext, flags, recursionCount);

        case TypeCategory::Unknown:
        case TypeCategory::Any:
        case TypeCategory::TypeVar:
        case TypeCategory::Union:
            break;
    }

    addTypeMismatch(diag, srcType, destType);
    return false;
}

bool TypeChecker::assignTypeToTypeVar(const TypeVarType& destTypeVar, const TypePtr& srcType,
                                      DiagnosticAddendum* diag, TypeVarContext& typeVarContext, uint32_t flags,
                                      int recursionCount) {
    const bool isContravariant = (flags & AssignTypeFlags::ReverseTypeVarMatching) != 0;

    TypePtr candidate = srcType;
    if ((flags & AssignTypeFlags::RetainLiteralsForTypeVar) == 0 && types::isClassInstance(candidate) &&
        types::asClass(candidate)->getLiteralValue()) {
        candidate = ClassType::cloneWithLiteral(*types::asClass(candidate), std::nullopt);
    }

    const TypePtr& bound = destTypeVar.getBound();
    if (bound && !isContravariant && !types::isAnyOrUnknown(candidate)) {
        if (!assignType(bound, candidate, createChildAddendum(diag), nullptr, AssignTypeFlags::Default,
                        recursionCount)) {
            if (diag) {
                diag->addMessage(Messages::typeAssignmentMismatch().format(
                    {{"sourceType", types::printType(candidate)}, {"destType", destTypeVar.getName()}}));
            }
            return false;
        }
    }

    TypePtr existing = typeVarContext.getTypeVarType(destTypeVar);
    if (!existing) {
        typeVarContext.setTypeVarType(destTypeVar, candidate);
        return true;
    }

    auto reportNotSolvable = [&]() {
        if (diag) {
            diag->addMessage(Messages::typeVarNotSolvable().format({{"sourceType", types::printType(candidate)},
                                                                    {"name", destTypeVar.getName()},
                                                                    {"destType", types::printType(existing)}}));
        }
    };

    if ((flags & AssignTypeFlags::EnforceInvariance) != 0) {
        if (types::isTypeSame(existing, candidate)) {
            return true;
        }
        reportNotSolvable();
        return false;
    }

    if (!isContravariant) {
        if (assignType(existing, candidate, nullptr, nullptr, AssignTypeFlags::Default, recursionCount)) {
            return true;
        }
        if (assignType(candidate, existing, nullptr, nullptr, AssignTypeFlags::Default, recursionCount)) {
            typeVarContext.setTypeVarType(destTypeVar, candidate);
            return true;
        }
        // Conflicting solutions widen to a union
        typeVarContext.setTypeVarType(destTypeVar, types::combineTypes({existing, candidate}));
        return true;
    }

    // Contravariant positions narrow the solution
    if (assignType(candidate, existing, nullptr, nullptr, AssignTypeFlags::Default, recursionCount)) {
        return true;
    }
    if (assignType(existing, candidate, nullptr, nullptr, AssignTypeFlags::Default, recursionCount)) {
        typeVarContext.setTypeVarType(destTypeVar, candidate);
        return true;
    }
    reportNotSolvable();
    return false;
}

bool TypeChecker::assignInvariant(const TypePtr& destType, const TypePtr& srcType, DiagnosticAddendum* diag,
                                  TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) {
    if (types::isTypeSame(destType, srcType)) {
        return true;
    }

    // Same class: compare the type arguments pairwise, solving variables on the way
    if (types::isClass(destType) && types::isClass(srcType)) {
        const ClassType& destClass = *types::asClass(destType);
        const ClassType& srcClass = *types::asClass(srcType);
        if (ClassType::isSameGenericClass(destClass, srcClass) && destClass.isInstance() == srcClass.isInstance() &&
            destClass.getLiteralValue() == srcClass.getLiteralValue()) {
            static const std::vector<TypePtr> noTypeArgs;
            const auto& destTypeArgs = destClass.getTypeArguments() ? *destClass.getTypeArguments() : noTypeArgs;
            const auto& srcTypeArgs = srcClass.getTypeArguments() ? *srcClass.getTypeArguments() : noTypeArgs;
            const size_t count = std::max(destTypeArgs.size(), srcTypeArgs.size());

            bool isAssignable = true;
            for (size_t i = 0; i < count; ++i) {
                TypePtr destTypeArg = i < destTypeArgs.size() ? destTypeArgs[i] : UnknownType::create();
                TypePtr srcTypeArg = i < srcTypeArgs.size() ? srcTypeArgs[i] : UnknownType::create();
                if (!assignType(destTypeArg, srcTypeArg, createChildAddendum(diag), typeVarContext, flags,
                                recursionCount)) {
                    isAssignable = false;
                }
            }
            if (isAssignable) {
                return true;
            }
        }
    }

    addTypeMismatch(diag, srcType, destType);
    return false;
}

bool TypeChecker::assignToClass(const ClassTypePtr& destType, const TypePtr& srcType, DiagnosticAddendum* diag,
                                TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) {
    // Everything is an object
    if (destType->isInstance() && destType->isBuiltIn("object")) {
        return true;
    }

    switch (srcType->getCategory()) {
        case TypeCategory::Class: {
            ClassTypePtr srcClass = types::asClass(srcType);
            if (destType->isInstance() == srcClass->isInstance()) {
                return assignClassToClass(destType, srcClass, diag, typeVarContext, flags, recursionCount);
            }

            if (destType->isInstance()) {
                // A class object compared against an instance type
                if (destType->isProtocolClass()) {
                    return assignClassToProtocol(destType, srcClass, diag, typeVarContext, flags, true,
                                                 recursionCount);
                }
                if (destType->isBuiltIn("type")) {
                    return true;
                }
                const TypePtr& metaclass = srcClass->getDetails().effectiveMetaclass;
                if (types::isInstantiableClass(metaclass) &&
                    !ClassType::isSameGenericClass(*types::asClass(metaclass), *srcClass)) {
                    return assignType(destType, ClassType::cloneAsInstance(*types::asClass(metaclass)), diag,
                                      typeVarContext, flags, recursionCount);
                }
            }
            break;
        }

        case TypeCategory::Module:
            if (destType->isInstance() && destType->isProtocolClass()) {
                trace("matching module '" + types::asModule(srcType)->getName() + "' against protocol '" +
                      destType->getDetails().name + "'");
                return canAssignModuleToProtocol(*this, destType, *types::asModule(srcType), diag, typeVarContext,
                                                 flags, recursionCount);
            }
            break;

        case TypeCategory::Function:
        case TypeCategory::OverloadedFunction:
            // Callback protocols are satisfied through their "__call__"
            if (destType->isInstance() && destType->isProtocolClass()) {
                if (TypePtr boundCall = getBoundCallMethod(destType, recursionCount)) {
                    return assignType(boundCall, srcType, diag, typeVarContext, flags, recursionCount);
                }
            }
            break;

        default:
            break;
    }

    addTypeMismatch(diag, srcType, destType);
    return false;
}

bool TypeChecker::assignClassToClass(const ClassTypePtr& destType, const ClassTypePtr& srcType,
                                     DiagnosticAddendum* diag, TypeVarContext* typeVarContext, uint32_t flags,
                                     int recursionCount) {
    if (destType->getLiteralValue()) {
        if (ClassType::isSameGenericClass(*destType, *srcType) &&
            srcType->getLiteralValue() == destType->getLiteralValue()) {
            return true;
        }
        addTypeMismatch(diag, srcType, destType);
        return false;
    }

    if (destType->isBuiltIn("object")) {
        return true;
    }

    // Numeric promotions
    if (destType->isBuiltIn("float") && types::derivesFromClass(*srcType, *builtins_.intClass)) {
        return true;
    }
    if (destType->isBuiltIn("complex") && (types::derivesFromClass(*srcType, *builtins_.intClass) ||
                                            types::derivesFromClass(*srcType, *builtins_.floatClass))) {
        return true;
    }

    for (const TypePtr& mroClass : types::getMroClasses(*srcType)) {
        if (!types::isInstantiableClass(mroClass)) {
            // Derives from an unknown class
            return true;
        }
        if (ClassType::isSameGenericClass(*types::asClass(mroClass), *destType)) {
            if (!destType->getTypeArguments()) {
                return true;
            }
            return verifyTypeArgumentsAssignable(*destType, *types::asClass(mroClass), diag, typeVarContext, flags,
                                                 recursionCount);
        }
    }

    if (destType->isProtocolClass()) {
        return assignClassToProtocol(destType, srcType, diag, typeVarContext, flags, false, recursionCount);
    }

    addTypeMismatch(diag, srcType, destType);
    return false;
}

static const char* getVarianceName(types::Variance variance) {
    switch (variance) {
        case types::Variance::Covariant:
            return "covariant";
        case types::Variance::Contravariant:
            return "contravariant";
        case types::Variance::Invariant:
            return "invariant";
    }
    return "invariant";
}

bool TypeChecker::verifyTypeArgumentsAssignable(const ClassType& destType, const ClassType& srcType,
                                                DiagnosticAddendum* diag, TypeVarContext* typeVarContext,
                                                uint32_t flags, int recursionCount) {
    if (!srcType.getTypeArguments()) {
        return true;
    }

    const auto& destTypeParams = destType.getDetails().typeParameters;
    static const std::vector<TypePtr> noTypeArgs;
    const auto& destTypeArgs = destType.getTypeArguments() ? *destType.getTypeArguments() : noTypeArgs;
    const auto& srcTypeArgs = *srcType.getTypeArguments();

    bool isCompatible = true;
    for (size_t srcArgIndex = 0; srcArgIndex < srcTypeArgs.size(); ++srcArgIndex) {
        const TypePtr& srcTypeArg = srcTypeArgs[srcArgIndex];
        const int destArgIndex = srcArgIndex >= destTypeArgs.size() ? static_cast<int>(destTypeArgs.size()) - 1
                                                                    : static_cast<int>(srcArgIndex);
        TypePtr destTypeArg = destArgIndex >= 0 ? destTypeArgs[destArgIndex] : UnknownType::create();
        types::TypeVarTypePtr destTypeParam =
            destArgIndex >= 0 && static_cast<size_t>(destArgIndex) < destTypeParams.size()
                ? destTypeParams[destArgIndex]
                : nullptr;
        const types::Variance variance = destTypeParam ? destTypeParam->getVariance() : types::Variance::Covariant;

        uint32_t effectiveFlags = flags | AssignTypeFlags::RetainLiteralsForTypeVar;
        if (variance == types::Variance::Contravariant) {
            effectiveFlags ^= AssignTypeFlags::ReverseTypeVarMatching;
        } else if (variance == types::Variance::Invariant) {
            effectiveFlags |= AssignTypeFlags::EnforceInvariance;
        }

        DiagnosticAddendum* childDiag = createChildAddendum(diag);
        const bool isContravariant = variance == types::Variance::Contravariant;
        if (!assignType(isContravariant ? srcTypeArg : destTypeArg, isContravariant ? destTypeArg : srcTypeArg,
                        createChildAddendum(childDiag), typeVarContext, effectiveFlags, recursionCount)) {
            if (childDiag) {
                childDiag->addMessage(Messages::typeArgumentMismatch().format(
                    {{"name", destTypeParam ? destTypeParam->getName() : std::string("?")},
                     {"variance", getVarianceName(variance)},
                     {"sourceType", types::printType(srcTypeArg)},
                     {"destType", types::printType(destTypeArg)}}));
            }
            isCompatible = false;
        }
    }
    return isCompatible;
}

TypePtr TypeChecker::getBoundCallMethod(const TypePtr& objectType, int recursionCount) {
    std::optional<types::ClassMember> callMember = types::lookUpClassMember(objectType, "__call__");
    if (!callMember || !types::isInstantiableClass(callMember->classType)) {
        return nullptr;
    }
    TypePtr callType = getTypeOfMember(*callMember);
    if (!types::isFunctionOrOverloaded(callType)) {
        return nullptr;
    }
    return bindFunctionToClassOrObject(objectType, callType, types::asClass(callMember->classType), recursionCount);
}

bool TypeChecker::assignToCallable(const TypePtr& destType, const TypePtr& srcType, DiagnosticAddendum* diag,
                                   TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) {
    TypePtr effectiveSrcType = srcType;
    if (types::isClassInstance(srcType)) {
        if (TypePtr boundCall = getBoundCallMethod(srcType, recursionCount)) {
            effectiveSrcType = boundCall;
        }
    }
    if (!types::isFunctionOrOverloaded(effectiveSrcType)) {
        addTypeMismatch(diag, srcType, destType);
        return false;
    }

    // Every destination overload must be satisfied
    if (destType->getCategory() == TypeCategory::OverloadedFunction) {
        for (const FunctionTypePtr& overload : types::asOverloaded(destType)->getOverloads()) {
            if (!assignToCallable(overload, effectiveSrcType, createChildAddendum(diag), typeVarContext, flags,
                                  recursionCount)) {
                if (diag) {
                    diag->addMessage(Messages::overloadNotAssignable().format({{"type", types::printType(overload)}}));
                }
                return false;
            }
        }
        return true;
    }

    const FunctionType& destFunction = *types::asFunction(destType);

    // Any source overload may match
    if (effectiveSrcType->getCategory() == TypeCategory::OverloadedFunction) {
        for (const FunctionTypePtr& overload : types::asOverloaded(effectiveSrcType)->getOverloads()) {
            if (!typeVarContext) {
                if (assignFunction(destFunction, *overload, nullptr, nullptr, flags, recursionCount)) {
                    return true;
                }
                continue;
            }
            TypeVarContext attempt = typeVarContext->clone();
            if (assignFunction(destFunction, *overload, nullptr, &attempt, flags, recursionCount)) {
                typeVarContext->copyFromClone(attempt);
                return true;
            }
        }
        if (diag) {
            diag->addMessage(Messages::overloadNotAssignable().format({{"type", types::printType(destType)}}));
        }
        return false;
    }

    return assignFunction(destFunction, *types::asFunction(effectiveSrcType), diag, typeVarContext, flags,
                          recursionCount);
}

namespace {

struct ParamLists {
    std::vector<const FunctionParam*> positional;
    // Simple parameters that follow "*args"
    std::vector<const FunctionParam*> keywordOnly;
    const FunctionParam* args = nullptr;
    const FunctionParam* kwargs = nullptr;
};

ParamLists partitionParams(const FunctionType& function) {
    ParamLists lists;
    for (const FunctionParam& param : function.getParams()) {
        switch (param.category) {
            case ParameterCategory::ArgsList:
                lists.args = &param;
                break;
            case ParameterCategory::KwargsDict:
                lists.kwargs = &param;
                break;
            case ParameterCategory::Simple:
                if (lists.args) {
                    lists.keywordOnly.push_back(&param);
                } else {
                    lists.positional.push_back(&param);
                }
                break;
        }
    }
    return lists;
}

TypePtr getParamType(const FunctionParam* param) {
    return param->type ? param->type : UnknownType::create();
}

const FunctionParam* findKeywordParam(const std::vector<const FunctionParam*>& params, size_t startIndex,
                                      const std::string& name) {
    for (size_t i = startIndex; i < params.size(); ++i) {
        if (params[i]->name == name && !params[i]->isPositionalOnly()) {
            return params[i];
        }
    }
    return nullptr;
}

} // namespace

bool TypeChecker::assignFunctionParam(const TypePtr& destParamType, const TypePtr& srcParamType, size_t paramIndex,
                                      DiagnosticAddendum* diag, TypeVarContext* typeVarContext, uint32_t flags,
                                      int recursionCount) {
    // Parameters are contravariant
    DiagnosticAddendum* paramDiag = createChildAddendum(diag);
    const uint32_t paramFlags =
        (flags ^ AssignTypeFlags::ReverseTypeVarMatching) & ~AssignTypeFlags::EnforceInvariance;
    if (!assignType(srcParamType, destParamType, createChildAddendum(paramDiag), typeVarContext, paramFlags,
                    recursionCount)) {
        if (paramDiag) {
            paramDiag->addMessage(Messages::paramAssignment().format({{"index", std::to_string(paramIndex + 1)},
                                                                      {"sourceType", types::printType(destParamType)},
                                                                      {"destType", types::printType(srcParamType)}}));
        }
        return false;
    }
    return true;
}

bool TypeChecker::assignFunction(const FunctionType& destType, const FunctionType& srcType, DiagnosticAddendum* diag,
                                 TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) {
    destType.inferReturnType();
    srcType.inferReturnType();

    const ParamLists destParams = partitionParams(destType);
    const ParamLists srcParams = partitionParams(srcType);
    const size_t destPositionalCount = destParams.positional.size();
    const size_t srcPositionalCount = srcParams.positional.size();
    bool canAssign = true;

    for (size_t i = 0; i < destPositionalCount; ++i) {
        const FunctionParam& destParam = *destParams.positional[i];
        if (i < srcPositionalCount) {
            const FunctionParam& srcParam = *srcParams.positional[i];
            if (!destParam.isPositionalOnly() && !srcParam.isPositionalOnly() && destParam.name != srcParam.name) {
                if (diag) {
                    diag->addMessage(Messages::functionParamName().format(
                        {{"destName", destParam.name}, {"srcName", srcParam.name}}));
                }
                canAssign = false;
            }
            if (!assignFunctionParam(getParamType(&destParam), getParamType(&srcParam), i, diag, typeVarContext,
                                     flags, recursionCount)) {
                canAssign = false;
            }
        } else if (srcParams.args) {
            if (!assignFunctionParam(getParamType(&destParam), getParamType(srcParams.args), i, diag,
                                     typeVarContext, flags, recursionCount)) {
                canAssign = false;
            }
        } else {
            if (diag) {
                diag->addMessage(Messages::functionTooFewParams().format(
                    {{"expected", std::to_string(destPositionalCount)},
                     {"received", std::to_string(srcPositionalCount)}}));
            }
            canAssign = false;
            break;
        }
    }

    // Extra source parameters must be optional or absorbed by the destination
    for (size_t i = destPositionalCount; i < srcPositionalCount; ++i) {
        const FunctionParam& srcParam = *srcParams.positional[i];
        if (srcParam.hasDefault) {
            continue;
        }
        if (destParams.args) {
            if (!assignFunctionParam(getParamType(destParams.args), getParamType(&srcParam), i, diag,
                                     typeVarContext, flags, recursionCount)) {
                canAssign = false;
            }
            continue;
        }
        if (!srcParam.isPositionalOnly() && findKeywordParam(destParams.keywordOnly, 0, srcParam.name)) {
            continue;
        }
        if (diag) {
            diag->addMessage(Messages::functionParamDefaultMissing().format({{"name", srcParam.name}}));
        }
        canAssign = false;
    }

    for (const FunctionParam* destParam : destParams.keywordOnly) {
        const FunctionParam* srcParam = findKeywordParam(srcParams.keywordOnly, 0, destParam->name);
        if (!srcParam) {
            srcParam = findKeywordParam(srcParams.positional, destPositionalCount, destParam->name);
        }
        if (!srcParam) {
            srcParam = srcParams.kwargs;
        }
        if (!srcParam) {
            if (diag) {
                diag->addMessage(Messages::functionParamMissing().format({{"name", destParam->name}}));
            }
            canAssign = false;
            continue;
        }
        if (!assignFunctionParam(getParamType(destParam), getParamType(srcParam), destPositionalCount, diag,
                                 typeVarContext, flags, recursionCount)) {
            canAssign = false;
        }
    }

    for (const FunctionParam* srcParam : srcParams.keywordOnly) {
        if (srcParam->hasDefault || findKeywordParam(destParams.keywordOnly, 0, srcParam->name)) {
            continue;
        }
        if (destParams.kwargs) {
            if (!assignFunctionParam(getParamType(destParams.kwargs), getParamType(srcParam), destPositionalCount,
                                     diag, typeVarContext, flags, recursionCount)) {
                canAssign = false;
            }
            continue;
        }
        if (diag) {
            diag->addMessage(Messages::functionParamDefaultMissing().format({{"name", srcParam->name}}));
        }
        canAssign = false;
    }

    if (destParams.args) {
        if (!srcParams.args) {
            if (diag) {
                diag->addMessage(Messages::argsParamMissing().format({{"name", destParams.args->name}}));
            }
            canAssign = false;
        } else if (!assignFunctionParam(getParamType(destParams.args), getParamType(srcParams.args),
                                        destPositionalCount, diag, typeVarContext, flags, recursionCount)) {
            canAssign = false;
        }
    }

    if (destParams.kwargs) {
        if (!srcParams.kwargs) {
            if (diag) {
                diag->addMessage(Messages::kwargsParamMissing().format({{"name", destParams.kwargs->name}}));
            }
            canAssign = false;
        } else if (!assignFunctionParam(getParamType(destParams.kwargs), getParamType(srcParams.kwargs),
                                        destPositionalCount, diag, typeVarContext, flags, recursionCount)) {
            canAssign = false;
        }
    }

    // Return types are covariant
    TypePtr destReturnType = destType.getEffectiveReturnType();
    TypePtr srcReturnType = srcType.getEffectiveReturnType();
    DiagnosticAddendum* returnDiag = createChildAddendum(diag);
    if (!assignType(destReturnType, srcReturnType, createChildAddendum(returnDiag), typeVarContext,
                    flags & ~AssignTypeFlags::EnforceInvariance, recursionCount)) {
        if (returnDiag) {
            returnDiag->addMessage(Messages::functionReturnTypeMismatch().format(
                {{"sourceType", types::printType(srcReturnType)}, {"destType", types::printType(destReturnType)}}));
        }
        canAssign = false;
    }

    return canAssign;
}

void TypeChecker::inferReturnTypeIfNecessary(const TypePtr& type) {
    if (types::isFunction(type)) {
        types::asFunction(type)->inferReturnType();
    } else if (type && type->getCategory() == TypeCategory::OverloadedFunction) {
        for (const FunctionTypePtr& overload : types::asOverloaded(type)->getOverloads()) {
            overload->inferReturnType();
        }
    }
}

TypePtr TypeChecker::bindFunctionToClassOrObject(const TypePtr& baseType, const TypePtr& memberType,
                                                 const ClassTypePtr& memberClass, int recursionCount,
                                                 bool treatConstructorAsClassMember, const TypePtr& firstParamType) {
    if (types::isFunction(memberType)) {
        return bindFunction(baseType, types::asFunction(memberType), memberClass, recursionCount,
                            treatConstructorAsClassMember, firstParamType);
    }

    if (memberType && memberType->getCategory() == TypeCategory::OverloadedFunction) {
        std::vector<FunctionTypePtr> boundOverloads;
        for (const FunctionTypePtr& overload : types::asOverloaded(memberType)->getOverloads()) {
            TypePtr boundOverload = bindFunction(baseType, overload, memberClass, recursionCount,
                                                 treatConstructorAsClassMember, firstParamType);
            // Overloads whose receiver doesn't match are dropped
            if (types::isFunction(boundOverload)) {
                boundOverloads.push_back(types::asFunction(boundOverload));
            }
        }
        if (boundOverloads.empty()) {
            return nullptr;
        }
        if (boundOverloads.size() == 1) {
            return boundOverloads.front();
        }
        return types::OverloadedFunctionType::create(std::move(boundOverloads));
    }

    return memberType;
}

TypePtr TypeChecker::bindFunction(const TypePtr& baseType, const FunctionTypePtr& function,
                                  const ClassTypePtr& memberClass, int recursionCount,
                                  bool treatConstructorAsClassMember, const TypePtr& firstParamType) {
    FunctionTypePtr memberFunction = function;
    if (memberClass && memberClass->getTypeArguments()) {
        memberFunction = types::asFunction(types::partiallySpecializeType(function, *memberClass));
    }

    if (!baseType) {
        return partiallySpecializeFunctionForBoundClassOrObject(memberFunction, nullptr, true, recursionCount);
    }

    const bool isConstructor = treatConstructorAsClassMember && memberFunction->getName() == "__new__";

    switch (memberFunction->getMethodKind()) {
        case types::MethodKind::Static:
            return memberFunction;

        case types::MethodKind::Class:
            break;

        case types::MethodKind::Instance:
            if (isConstructor) {
                break;
            }
            {
                TypePtr baseObject = types::isInstantiableClass(baseType)
                                         ? TypePtr(ClassType::cloneAsInstance(*types::asClass(baseType)))
                                         : baseType;
                // An instance method looked up on the class stays unbound
                const bool stripFirstParam = types::isClassInstance(baseType) || firstParamType != nullptr;
                return partiallySpecializeFunctionForBoundClassOrObject(
                    memberFunction, firstParamType ? firstParamType : baseObject, stripFirstParam, recursionCount);
            }
    }

    TypePtr baseClass = types::isClassInstance(baseType)
                            ? TypePtr(ClassType::cloneAsInstantiable(*types::asClass(baseType)))
                            : baseType;
    return partiallySpecializeFunctionForBoundClassOrObject(memberFunction, firstParamType ? firstParamType : baseClass,
                                                            true, recursionCount);
}

TypePtr TypeChecker::partiallySpecializeFunctionForBoundClassOrObject(const FunctionTypePtr& function,
                                                                      const TypePtr& firstParamType,
                                                                      bool stripFirstParam, int recursionCount) {
    const auto& params = function->getParams();
    if (params.empty() || params.front().category != ParameterCategory::Simple) {
        return function;
    }

    // The receiver may solve type variables of the function itself
    TypeVarContext typeVarContext(function->getTypeVarScopeId());
    const FunctionParam& firstParam = params.front();
    if (firstParam.type && firstParam.type->getCategory() == TypeCategory::TypeVar) {
        typeVarContext.addSolveForScope(types::asTypeVar(firstParam.type)->getScopeId());
    }
    if (firstParam.type && firstParamType) {
        if (!assignType(firstParam.type, firstParamType, nullptr, &typeVarContext, AssignTypeFlags::Default,
                        recursionCount)) {
            return nullptr;
        }
    }

    function->inferReturnType();
    FunctionTypePtr specializedFunction = types::asFunction(types::applySolvedTypeVars(function, typeVarContext));
    if (!stripFirstParam) {
        return specializedFunction;
    }

    std::vector<FunctionParam> remainingParams(specializedFunction->getParams().begin() + 1,
                                               specializedFunction->getParams().end());
    return FunctionType::cloneWithSignature(*specializedFunction, std::move(remainingParams),
                                            specializedFunction->getDeclaredReturnType());
}

types::ClassTypePtr TypeChecker::getTypedDictClassType() {
    return typedDictClass_ ? typedDictClass_ : builtins_.typedDictPlaceholder;
}

TypePtr TypeChecker::getDeclaredTypeOfSymbol(const types::Symbol& symbol) {
    std::vector<const types::Declaration*> typedDecls = symbol.getTypedDeclarations();
    if (typedDecls.empty()) {
        return symbol.getSynthesizedType();
    }

    // The last declaration wins
    const types::Declaration* decl = typedDecls.back();
    if (decl->typeAnnotation) {
        return decl->typeAnnotation;
    }
    return decl->inferredType ? decl->inferredType : UnknownType::create();
}

TypePtr TypeChecker::getEffectiveTypeOfSymbol(const types::Symbol& symbol) {
    if (TypePtr declaredType = getDeclaredTypeOfSymbol(symbol)) {
        return declaredType;
    }

    std::vector<TypePtr> inferredTypes;
    for (const types::Declaration& decl : symbol.getDeclarations()) {
        if (decl.inferredType) {
            inferredTypes.push_back(decl.inferredType);
        }
    }
    if (inferredTypes.empty()) {
        return UnknownType::create();
    }
    return types::combineTypes(inferredTypes);
}

TypePtr TypeChecker::getTypeOfMember(const types::ClassMember& member) {
    if (!types::isInstantiableClass(member.classType)) {
        return UnknownType::create();
    }
    return types::partiallySpecializeType(getEffectiveTypeOfSymbol(*member.symbol), *types::asClass(member.classType));
}

} // namespace semantic
} // namespace protocheck
