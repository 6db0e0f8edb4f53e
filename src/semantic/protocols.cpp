#include "protocheck/semantic/protocols.h"
#include "protocheck/types/type_utils.h"
#include <llvm/ADT/ScopeExit.h>
#include <llvm/ADT/StringSet.h>
#include <cassert>

namespace protocheck {
namespace semantic {

using types::ClassMember;
using types::ClassType;
using types::ClassTypePtr;
using types::Symbol;
using types::TypePtr;
using types::TypeVarContext;

bool ProtocolAssignmentStack::contains(const ClassTypePtr& srcType, const ClassTypePtr& destType) const {
    for (const Entry& entry : entries_) {
        if (types::isTypeSame(entry.srcType, srcType) && types::isTypeSame(entry.destType, destType)) {
            return true;
        }
    }
    return false;
}

void ProtocolAssignmentStack::push(ClassTypePtr srcType, ClassTypePtr destType) {
    entries_.push_back(Entry{std::move(srcType), std::move(destType)});
}

void ProtocolAssignmentStack::pop() {
    assert(!entries_.empty() && "unbalanced protocol assignment stack");
    entries_.pop_back();
}

static ClassTypePtr toInstantiable(const ClassTypePtr& classType) {
    return classType->isInstance() ? ClassType::cloneAsInstantiable(*classType) : classType;
}

// Mutable (non-final) variables must match invariantly
static bool isPrimaryDeclMutableVariable(const Symbol& symbol) {
    const auto& decls = symbol.getDeclarations();
    return !decls.empty() && decls.front().type == types::DeclarationType::Variable && !decls.front().isFinal;
}

// The protocol class as declared, followed by its ancestors
static llvm::SmallVector<TypePtr, 8> getProtocolMro(const ClassTypePtr& genericDestType) {
    llvm::SmallVector<TypePtr, 8> mro;
    mro.push_back(genericDestType);
    for (const TypePtr& mroClass : genericDestType->getDetails().mro) {
        mro.push_back(mroClass);
    }
    return mro;
}

static bool canAssignClassToProtocolInternal(TypeEvaluator& evaluator, const ClassTypePtr& destType,
                                             ClassTypePtr srcType, DiagnosticAddendum* diag,
                                             TypeVarContext* typeVarContext, uint32_t flags,
                                             bool treatSourceAsInstantiable, int recursionCount) {
    if ((flags & AssignTypeFlags::EnforceInvariance) != 0) {
        return types::isTypeSame(destType, srcType);
    }

    // Type arguments are solved afresh from the members and verified at the end
    ClassTypePtr genericDestType = ClassType::cloneForSpecialization(*destType, std::nullopt, false);
    TypeVarContext genericDestTypeVarContext(types::getTypeVarScopeId(destType));

    TypeVarContext selfTypeVarContext(types::getTypeVarScopeId(destType));
    types::populateTypeVarContextForSelfType(selfTypeVarContext, *destType, *srcType);

    // Synthesized TypedDict members never count as protocol members
    if (srcType->isTypedDictClass()) {
        ClassTypePtr typedDictClassType = evaluator.getTypedDictClassType();
        if (typedDictClassType && typedDictClassType->isInstantiable()) {
            srcType = typedDictClassType;
        }
    }

    bool typesAreConsistent = true;
    llvm::StringSet<> checkedSymbolSet;
    const uint32_t assignFlags = types::containsLiteralType(srcType, true)
                                     ? AssignTypeFlags::RetainLiteralsForTypeVar
                                     : AssignTypeFlags::Default;

    for (const TypePtr& mroEntry : getProtocolMro(genericDestType)) {
        if (!types::isInstantiableClass(mroEntry) || !types::asClass(mroEntry)->isProtocolClass()) {
            continue;
        }
        ClassTypePtr mroClass = types::asClass(mroEntry);

        for (const auto& field : mroClass->getDetails().fields) {
            const std::string& name = field.first;
            const Symbol& symbol = *field.second;
            if (!symbol.isClassMember() || symbol.isIgnoredForProtocolMatch() || checkedSymbolSet.count(name)) {
                continue;
            }
            if (!treatSourceAsInstantiable && name == "__class_getitem__") {
                continue;
            }
            if (name == "__slots__") {
                continue;
            }

            // Redeclarations further up the MRO are not checked again
            checkedSymbolSet.insert(name);

            bool isMemberFromMetaclass = false;
            std::optional<ClassMember> srcMemberInfo;

            const TypePtr& metaclass = srcType->getDetails().effectiveMetaclass;
            if (treatSourceAsInstantiable && types::isInstantiableClass(metaclass)) {
                srcMemberInfo = types::lookUpClassMember(metaclass, name);
                if (srcMemberInfo) {
                    isMemberFromMetaclass = true;
                }
            }
            if (!srcMemberInfo) {
                srcMemberInfo = types::lookUpClassMember(srcType, name);
            }

            if (!srcMemberInfo) {
                if (diag) {
                    diag->addMessage(Messages::protocolMemberMissing().format({{"name", name}}));
                }
                typesAreConsistent = false;
                continue;
            }

            TypePtr destMemberType = evaluator.getDeclaredTypeOfSymbol(symbol);
            if (destMemberType) {
                if (!ClassType::isSameGenericClass(*mroClass, *destType)) {
                    destMemberType = types::partiallySpecializeType(destMemberType, *mroClass);
                }

                TypePtr srcMemberType;
                if (types::isInstantiableClass(srcMemberInfo->classType)) {
                    TypePtr symbolType = evaluator.getEffectiveTypeOfSymbol(*srcMemberInfo->symbol);
                    if (types::isFunction(symbolType)) {
                        evaluator.inferReturnTypeIfNecessary(symbolType);
                    }
                    srcMemberType = types::partiallySpecializeType(
                        symbolType, *types::asClass(srcMemberInfo->classType), srcType);
                } else {
                    srcMemberType = types::UnknownType::create();
                }

                if (types::isFunctionOrOverloaded(srcMemberType)) {
                    if (isMemberFromMetaclass) {
                        // Metaclass methods receive the class object itself
                        TypePtr boundSrcFunction = evaluator.bindFunctionToClassOrObject(
                            srcType, srcMemberType, nullptr, recursionCount, false, srcType);
                        if (boundSrcFunction) {
                            srcMemberType = types::removeParamSpecVariadicsFromSignature(boundSrcFunction);
                        }

                        if (types::isFunctionOrOverloaded(destMemberType)) {
                            TypePtr boundDeclaredType = evaluator.bindFunctionToClassOrObject(
                                srcType, destMemberType, nullptr, recursionCount, false, srcType);
                            if (boundDeclaredType) {
                                destMemberType = types::removeParamSpecVariadicsFromSignature(boundDeclaredType);
                            }
                        }
                    } else if (types::isInstantiableClass(srcMemberInfo->classType)) {
                        destMemberType = types::applySolvedTypeVars(destMemberType, selfTypeVarContext);

                        ClassTypePtr srcOwner = types::asClass(srcMemberInfo->classType);
                        TypePtr receiver = treatSourceAsInstantiable ? TypePtr(srcType)
                                                                     : TypePtr(ClassType::cloneAsInstance(*srcType));
                        TypePtr boundSrcFunction =
                            evaluator.bindFunctionToClassOrObject(receiver, srcMemberType, srcOwner, recursionCount);
                        if (boundSrcFunction) {
                            srcMemberType = types::removeParamSpecVariadicsFromSignature(boundSrcFunction);
                        }

                        if (types::isFunctionOrOverloaded(destMemberType)) {
                            TypePtr boundDeclaredType = evaluator.bindFunctionToClassOrObject(
                                ClassType::cloneAsInstance(*srcType), destMemberType, srcOwner, recursionCount);
                            if (boundDeclaredType) {
                                destMemberType = types::removeParamSpecVariadicsFromSignature(boundDeclaredType);
                            }
                        }
                    }
                } else {
                    destMemberType = types::applySolvedTypeVars(destMemberType, selfTypeVarContext);
                }

                DiagnosticAddendum* subDiag = createChildAddendum(diag);

                if (types::isClassInstance(destMemberType) && types::asClass(destMemberType)->isPropertyClass()) {
                    if (types::isClassInstance(srcMemberType) && types::asClass(srcMemberType)->isPropertyClass() &&
                        !treatSourceAsInstantiable) {
                        if (!evaluator.assignProperty(ClassType::cloneAsInstantiable(*types::asClass(destMemberType)),
                                                      ClassType::cloneAsInstantiable(*types::asClass(srcMemberType)),
                                                      *mroClass, *srcType, createChildAddendum(subDiag),
                                                      &genericDestTypeVarContext, &selfTypeVarContext,
                                                      recursionCount)) {
                            if (subDiag) {
                                subDiag->addMessage(Messages::memberTypeMismatch().format({{"name", name}}));
                            }
                            typesAreConsistent = false;
                        }
                    } else {
                        // A property is satisfied by anything readable as its getter type
                        TypePtr getterType =
                            evaluator.getGetterTypeFromProperty(*types::asClass(destMemberType), true);
                        if (!getterType ||
                            !evaluator.assignType(getterType, srcMemberType, createChildAddendum(subDiag),
                                                  &genericDestTypeVarContext, assignFlags, recursionCount)) {
                            if (subDiag) {
                                subDiag->addMessage(Messages::memberTypeMismatch().format({{"name", name}}));
                            }
                            typesAreConsistent = false;
                        }
                    }
                } else {
                    const bool isInvariant = isPrimaryDeclMutableVariable(symbol);
                    const uint32_t memberFlags =
                        isInvariant ? (assignFlags | AssignTypeFlags::EnforceInvariance) : assignFlags;
                    if (!evaluator.assignType(destMemberType, srcMemberType, createChildAddendum(subDiag),
                                              &genericDestTypeVarContext, memberFlags, recursionCount)) {
                        if (subDiag) {
                            if (isInvariant) {
                                subDiag->addMessage(Messages::memberIsInvariant().format({{"name", name}}));
                            }
                            subDiag->addMessage(Messages::memberTypeMismatch().format({{"name", name}}));
                        }
                        typesAreConsistent = false;
                    }
                }

                const bool isDestFinal = symbol.isFinalVariable();
                const bool isSrcFinal = srcMemberInfo->symbol->isFinalVariable();
                if (isDestFinal != isSrcFinal) {
                    if (subDiag) {
                        if (isDestFinal) {
                            subDiag->addMessage(Messages::memberIsFinalInProtocol().format({{"name", name}}));
                        } else {
                            subDiag->addMessage(Messages::memberIsNotFinalInProtocol().format({{"name", name}}));
                        }
                    }
                    typesAreConsistent = false;
                }
            }

            if (symbol.isClassVar() && !srcMemberInfo->symbol->isClassMember()) {
                if (diag) {
                    diag->addMessage(Messages::protocolMemberClassVar().format({{"name", name}}));
                }
                typesAreConsistent = false;
            }
        }
    }

    // The solved specialization must agree with the protocol's type arguments
    if (typesAreConsistent && !destType->getDetails().typeParameters.empty() && destType->getTypeArguments()) {
        TypePtr specializedDestProtocol =
            types::applySolvedTypeVars(genericDestType, genericDestTypeVarContext, true);
        if (!evaluator.verifyTypeArgumentsAssignable(*destType, *types::asClass(specializedDestProtocol), diag,
                                                     typeVarContext, flags, recursionCount)) {
            typesAreConsistent = false;
        }
    }

    return typesAreConsistent;
}

bool canAssignClassToProtocol(TypeEvaluator& evaluator, ProtocolAssignmentStack& pendingStack,
                              const ClassTypePtr& destType, const ClassTypePtr& srcType, DiagnosticAddendum* diag,
                              TypeVarContext* typeVarContext, uint32_t flags, bool treatSourceAsInstantiable,
                              int recursionCount) {
    if (recursionCount > types::maxTypeRecursionCount) {
        return true;
    }
    recursionCount++;

    ClassTypePtr dest = toInstantiable(destType);
    ClassTypePtr src = toInstantiable(srcType);

    // A comparison already in progress is assumed to hold
    if (pendingStack.contains(src, dest)) {
        return true;
    }

    pendingStack.push(src, dest);
    auto popOnExit = llvm::make_scope_exit([&pendingStack] { pendingStack.pop(); });

    return canAssignClassToProtocolInternal(evaluator, dest, src, diag, typeVarContext, flags,
                                            treatSourceAsInstantiable, recursionCount);
}

bool canAssignModuleToProtocol(TypeEvaluator& evaluator, const ClassTypePtr& destType,
                               const types::ModuleType& srcType, DiagnosticAddendum* diag,
                               TypeVarContext* typeVarContext, uint32_t flags, int recursionCount) {
    if (recursionCount > types::maxTypeRecursionCount) {
        return true;
    }
    recursionCount++;

    ClassTypePtr dest = toInstantiable(destType);
    bool typesAreConsistent = true;
    llvm::StringSet<> checkedSymbolSet;

    ClassTypePtr genericDestType = ClassType::cloneForSpecialization(*dest, std::nullopt, false);
    TypeVarContext genericDestTypeVarContext(types::getTypeVarScopeId(dest));

    for (const TypePtr& mroEntry : getProtocolMro(genericDestType)) {
        if (!types::isInstantiableClass(mroEntry) || !types::asClass(mroEntry)->isProtocolClass()) {
            continue;
        }
        ClassTypePtr mroClass = types::asClass(mroEntry);

        for (const auto& field : mroClass->getDetails().fields) {
            const std::string& name = field.first;
            const Symbol& symbol = *field.second;
            if (!symbol.isClassMember() || symbol.isIgnoredForProtocolMatch() || checkedSymbolSet.count(name)) {
                continue;
            }
            if (name == "__slots__") {
                continue;
            }
            checkedSymbolSet.insert(name);

            const Symbol* memberSymbol = srcType.getFields().lookup(name);
            if (!memberSymbol) {
                if (diag) {
                    diag->addMessage(Messages::protocolMemberMissing().format({{"name", name}}));
                }
                typesAreConsistent = false;
                continue;
            }

            TypePtr destMemberType = evaluator.getDeclaredTypeOfSymbol(symbol);
            if (!destMemberType) {
                continue;
            }
            if (!ClassType::isSameGenericClass(*mroClass, *dest)) {
                destMemberType = types::partiallySpecializeType(destMemberType, *mroClass);
            }

            TypePtr srcMemberType = evaluator.getEffectiveTypeOfSymbol(*memberSymbol);

            // Module functions are compared against the protocol's bound methods
            if (types::isFunctionOrOverloaded(srcMemberType) && types::isFunctionOrOverloaded(destMemberType)) {
                TypePtr boundDeclaredType = evaluator.bindFunctionToClassOrObject(
                    ClassType::cloneAsInstance(*dest), destMemberType, dest, recursionCount);
                if (boundDeclaredType) {
                    destMemberType = boundDeclaredType;
                }
            }

            DiagnosticAddendum* subDiag = createChildAddendum(diag);
            if (!evaluator.assignType(destMemberType, srcMemberType, createChildAddendum(subDiag),
                                      &genericDestTypeVarContext, AssignTypeFlags::Default, recursionCount)) {
                if (subDiag) {
                    subDiag->addMessage(Messages::memberTypeMismatch().format({{"name", name}}));
                }
                typesAreConsistent = false;
            }
        }
    }

    if (typesAreConsistent && !dest->getDetails().typeParameters.empty() && dest->getTypeArguments()) {
        TypePtr specializedDestProtocol =
            types::applySolvedTypeVars(genericDestType, genericDestTypeVarContext, true);
        if (!evaluator.verifyTypeArgumentsAssignable(*dest, *types::asClass(specializedDestProtocol), diag,
                                                     typeVarContext, flags, recursionCount)) {
            typesAreConsistent = false;
        }
    }

    return typesAreConsistent;
}

bool canAssignProtocolClassToSelf(TypeEvaluator& evaluator, const ClassTypePtr& destType,
                                  const ClassTypePtr& srcType, int recursionCount) {
    assert(destType->isProtocolClass());
    assert(srcType->isProtocolClass());
    assert(ClassType::isSameGenericClass(*destType, *srcType));
    assert(!destType->getDetails().typeParameters.empty());

    DiagnosticAddendum diag;
    TypeVarContext typeVarContext;
    bool isAssignable = true;

    for (const auto& field : destType->getDetails().fields) {
        if (!isAssignable) {
            break;
        }
        const std::string& name = field.first;
        const Symbol& symbol = *field.second;
        if (!symbol.isClassMember() || symbol.isIgnoredForProtocolMatch()) {
            continue;
        }

        std::optional<ClassMember> memberInfo = types::lookUpClassMember(srcType, name);
        assert(memberInfo && "member of a protocol missing from its own specialization");
        if (!memberInfo) {
            continue;
        }

        TypePtr destMemberType = evaluator.getDeclaredTypeOfSymbol(symbol);
        if (!destMemberType) {
            continue;
        }
        TypePtr srcMemberType = evaluator.getTypeOfMember(*memberInfo);
        destMemberType = types::partiallySpecializeType(destMemberType, *destType);

        if (types::isClassInstance(destMemberType) && types::asClass(destMemberType)->isPropertyClass() &&
            types::isClassInstance(srcMemberType) && types::asClass(srcMemberType)->isPropertyClass()) {
            if (!evaluator.assignProperty(ClassType::cloneAsInstantiable(*types::asClass(destMemberType)),
                                          ClassType::cloneAsInstantiable(*types::asClass(srcMemberType)), *destType,
                                          *srcType, &diag, &typeVarContext, nullptr, recursionCount)) {
                isAssignable = false;
            }
        } else {
            const uint32_t flags = isPrimaryDeclMutableVariable(symbol) ? AssignTypeFlags::EnforceInvariance
                                                                        : AssignTypeFlags::Default;
            if (!evaluator.assignType(destMemberType, srcMemberType, &diag, &typeVarContext, flags,
                                      recursionCount)) {
                isAssignable = false;
            }
        }
    }

    // Generic protocol bases carry their own members
    for (const TypePtr& baseClass : destType->getDetails().baseClasses) {
        if (!types::isInstantiableClass(baseClass)) {
            continue;
        }
        ClassTypePtr baseClassType = types::asClass(baseClass);
        if (baseClassType->isProtocolClass() && !baseClassType->isBuiltIn("object") &&
            !baseClassType->isBuiltIn("Protocol") && !baseClassType->isBuiltIn("Generic") &&
            !baseClassType->getDetails().typeParameters.empty()) {
            ClassTypePtr specializedDestBaseClass = types::specializeForBaseClass(*destType, baseClassType);
            ClassTypePtr specializedSrcBaseClass = types::specializeForBaseClass(*srcType, baseClassType);
            if (!canAssignProtocolClassToSelf(evaluator, specializedDestBaseClass, specializedSrcBaseClass,
                                              recursionCount)) {
                isAssignable = false;
            }
        }
    }

    return isAssignable;
}

} // namespace semantic
} // namespace protocheck
