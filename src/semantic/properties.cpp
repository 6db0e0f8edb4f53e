#include "protocheck/semantic/type_checker.h"

namespace protocheck {
namespace semantic {

using types::ClassType;
using types::ClassTypePtr;
using types::FunctionTypePtr;
using types::TypePtr;

namespace {

struct PropertyAccessor {
    FunctionTypePtr types::ClassDetails::*member;
    MessageTemplate (*missingMessage)();
    const char* name;
};

const PropertyAccessor propertyAccessors[] = {
    {&types::ClassDetails::fget, &Messages::missingGetter, "getter"},
    {&types::ClassDetails::fset, &Messages::missingSetter, "setter"},
    {&types::ClassDetails::fdel, &Messages::missingDeleter, "deleter"},
};

} // namespace

bool TypeChecker::assignProperty(const ClassTypePtr& destPropertyType, const ClassTypePtr& srcPropertyType,
                                 const ClassType& destOwner, const ClassType& srcOwner, DiagnosticAddendum* diag,
                                 types::TypeVarContext* typeVarContext,
                                 const types::TypeVarContext* selfTypeVarContext, int recursionCount) {
    bool isAssignable = true;
    TypePtr srcObject = ClassType::cloneAsInstance(srcOwner);

    for (const PropertyAccessor& accessor : propertyAccessors) {
        const FunctionTypePtr& destAccessor = destPropertyType->getDetails().*accessor.member;
        if (!destAccessor) {
            continue;
        }

        const FunctionTypePtr& srcAccessor = srcPropertyType->getDetails().*accessor.member;
        if (!srcAccessor) {
            if (diag) {
                diag->addMessage(accessor.missingMessage().format({}));
            }
            isAssignable = false;
            continue;
        }

        srcAccessor->inferReturnType();
        TypePtr srcAccessorType = types::partiallySpecializeType(srcAccessor, srcOwner);
        TypePtr destAccessorType = types::partiallySpecializeType(destAccessor, destOwner);
        if (selfTypeVarContext) {
            destAccessorType = types::applySolvedTypeVars(destAccessorType, *selfTypeVarContext);
        }

        // Both accessors are compared as bound to the source object
        TypePtr boundDestAccessor = bindFunctionToClassOrObject(srcObject, destAccessorType, nullptr, recursionCount);
        TypePtr boundSrcAccessor = bindFunctionToClassOrObject(srcObject, srcAccessorType, nullptr, recursionCount);

        if (!boundDestAccessor || !boundSrcAccessor ||
            !assignType(boundDestAccessor, boundSrcAccessor, createChildAddendum(diag), typeVarContext,
                        AssignTypeFlags::Default, recursionCount)) {
            if (diag) {
                diag->addMessage(Messages::propertyAccessorMismatch().format({{"accessor", accessor.name}}));
            }
            isAssignable = false;
        }
    }

    return isAssignable;
}

TypePtr TypeChecker::getGetterTypeFromProperty(const ClassType& propertyClass, bool inferTypeIfNeeded) {
    const FunctionTypePtr& getter = propertyClass.getDetails().fget;
    if (!getter) {
        return nullptr;
    }
    if (inferTypeIfNeeded) {
        getter->inferReturnType();
        return getter->getEffectiveReturnType();
    }
    return getter->getDeclaredReturnType();
}

} // namespace semantic
} // namespace protocheck
