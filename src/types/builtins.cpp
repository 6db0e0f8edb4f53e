#include "protocheck/types/builtins.h"
#include "protocheck/types/type_utils.h"

namespace protocheck {
namespace types {

static FunctionTypePtr makeMethod(const std::string& name, std::vector<FunctionParam> extraParams, TypePtr returnType) {
    std::vector<FunctionParam> params;
    params.emplace_back("self", nullptr);
    for (auto& param : extraParams) {
        params.push_back(std::move(param));
    }
    return std::make_shared<FunctionType>(name, std::move(params), std::move(returnType));
}

static void addMethod(const ClassType& classType, FunctionTypePtr method) {
    std::string name = method->getName();
    auto symbol = std::make_unique<Symbol>(SymbolFlags::ClassMember);
    symbol->addDeclaration(Declaration::function(std::move(method)));
    classType.getDetailsPtr()->addField(name, std::move(symbol));
}

static ClassTypePtr createBuiltinClass(TypeStore& store, const std::string& name, uint32_t flags = ClassTypeFlags::None) {
    return ClassType::createInstantiable(
        store.createClassDetails(name, ClassTypeFlags::BuiltInClass | flags, "builtins"));
}

BuiltinTypes BuiltinTypes::create(TypeStore& store) {
    BuiltinTypes builtins;

    builtins.objectClass = createBuiltinClass(store, "object");
    builtins.typeClass = createBuiltinClass(store, "type");
    builtins.objectClass->getDetailsPtr()->effectiveMetaclass = builtins.typeClass;
    builtins.finalizeClass(*builtins.typeClass, {}, builtins.typeClass);

    builtins.intClass = createBuiltinClass(store, "int");
    builtins.floatClass = createBuiltinClass(store, "float");
    builtins.complexClass = createBuiltinClass(store, "complex");
    builtins.strClass = createBuiltinClass(store, "str");
    builtins.propertyClass = createBuiltinClass(store, "property");
    builtins.protocolClass = createBuiltinClass(store, "Protocol");
    builtins.genericClass = createBuiltinClass(store, "Generic");
    for (const auto& classType : {builtins.intClass, builtins.floatClass, builtins.complexClass, builtins.strClass,
                                  builtins.propertyClass, builtins.protocolClass, builtins.genericClass}) {
        builtins.finalizeClass(*classType);
    }

    builtins.boolClass = createBuiltinClass(store, "bool", ClassTypeFlags::Final);
    builtins.finalizeClass(*builtins.boolClass, {builtins.intClass});

    TypePtr intObject = builtins.intInstance();
    TypePtr floatObject = builtins.floatInstance();
    TypePtr strObject = builtins.strInstance();

    auto nameSymbol = std::make_unique<Symbol>(SymbolFlags::ClassMember);
    nameSymbol->addDeclaration(Declaration::variable(strObject));
    builtins.typeClass->getDetailsPtr()->addField("__name__", std::move(nameSymbol));

    addMethod(*builtins.intClass, makeMethod("__abs__", {}, intObject));
    addMethod(*builtins.intClass, makeMethod("__index__", {}, intObject));
    addMethod(*builtins.intClass, makeMethod("bit_length", {}, intObject));
    addMethod(*builtins.floatClass, makeMethod("__abs__", {}, floatObject));
    addMethod(*builtins.floatClass, makeMethod("is_integer", {}, builtins.boolInstance()));
    addMethod(*builtins.strClass, makeMethod("__len__", {}, intObject));
    addMethod(*builtins.strClass, makeMethod("upper", {}, strObject));

    // Only the members every TypedDict really has
    builtins.typedDictPlaceholder = createBuiltinClass(store, "_TypedDict");
    builtins.finalizeClass(*builtins.typedDictPlaceholder);
    TypePtr placeholderSelf = TypeVarType::createSynthesizedSelf(*builtins.typedDictPlaceholder);
    addMethod(*builtins.typedDictPlaceholder, makeMethod("copy", {}, placeholderSelf));
    addMethod(*builtins.typedDictPlaceholder, makeMethod("keys", {}, builtins.objectInstance()));
    addMethod(*builtins.typedDictPlaceholder, makeMethod("__len__", {}, intObject));

    return builtins;
}

ClassTypePtr BuiltinTypes::createClass(TypeStore& store, const std::string& name, uint32_t flags) const {
    return ClassType::createInstantiable(store.createClassDetails(name, flags));
}

TypeVarTypePtr BuiltinTypes::addTypeParameter(const ClassType& classType, const std::string& name, Variance variance,
                                              TypePtr bound) const {
    ClassDetails* details = classType.getDetailsPtr();
    TypeVarTypePtr typeParam = TypeVarType::create(name, details->typeVarScopeId, variance, std::move(bound));
    details->typeParameters.push_back(typeParam);
    return typeParam;
}

void BuiltinTypes::finalizeClass(const ClassType& classType, std::vector<TypePtr> bases, TypePtr metaclass) const {
    ClassDetails* details = classType.getDetailsPtr();
    if (bases.empty() && !ClassType::isSameGenericClass(classType, *objectClass)) {
        bases.push_back(objectClass);
    }
    details->baseClasses = std::move(bases);

    if (!metaclass) {
        for (const TypePtr& base : details->baseClasses) {
            if (isInstantiableClass(base)) {
                metaclass = asClass(base)->getDetails().effectiveMetaclass;
                break;
            }
        }
    }
    details->effectiveMetaclass = metaclass ? metaclass : TypePtr(typeClass);

    computeMroLinearization(classType);
}

ClassTypePtr BuiltinTypes::declareClass(TypeStore& store, const std::string& name, std::vector<TypePtr> bases,
                                        uint32_t flags, TypePtr metaclass) const {
    ClassTypePtr classType = createClass(store, name, flags);
    finalizeClass(*classType, std::move(bases), std::move(metaclass));
    return classType;
}

ClassTypePtr BuiltinTypes::declareProtocol(TypeStore& store, const std::string& name,
                                           std::vector<TypePtr> bases) const {
    ClassTypePtr classType = createClass(store, name, ClassTypeFlags::ProtocolClass);
    bases.push_back(protocolClass);
    finalizeClass(*classType, std::move(bases));
    return classType;
}

ClassTypePtr BuiltinTypes::createProperty(TypeStore& store, FunctionTypePtr fget, FunctionTypePtr fset,
                                          FunctionTypePtr fdel) const {
    ClassDetails* details = store.createClassDetails("property", ClassTypeFlags::PropertyClass);
    details->fget = std::move(fget);
    details->fset = std::move(fset);
    details->fdel = std::move(fdel);
    ClassTypePtr propertyObject = ClassType::createInstance(details);
    finalizeClass(*propertyObject, {propertyClass});
    return propertyObject;
}

} // namespace types
} // namespace protocheck
