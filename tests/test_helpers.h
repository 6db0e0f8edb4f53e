#pragma once

#include "protocheck/error_reporter.h"
#include "protocheck/semantic/type_checker.h"
#include "protocheck/types/builtins.h"
#include "protocheck/types/symbol.h"
#include "protocheck/types/type_store.h"
#include "protocheck/types/types.h"
#include <memory>
#include <string>
#include <vector>

namespace protocheck {
namespace test {

// One checking session: a reporter, a store and a checker over them
struct CheckerFixture {
    ErrorReporter reporter;
    types::TypeStore store;
    semantic::TypeChecker checker;

    CheckerFixture() : checker(reporter, store) {}

    const types::BuiltinTypes& builtins() const { return checker.getBuiltins(); }
};

inline types::FunctionTypePtr makeFunction(const std::string& name, std::vector<types::FunctionParam> params,
                                           types::TypePtr returnType,
                                           types::MethodKind kind = types::MethodKind::Instance) {
    return std::make_shared<types::FunctionType>(name, std::move(params), std::move(returnType), kind);
}

// Method with an unannotated receiver ("self", or "cls" for class methods)
inline types::FunctionTypePtr makeMethod(const std::string& name, std::vector<types::FunctionParam> params,
                                         types::TypePtr returnType,
                                         types::MethodKind kind = types::MethodKind::Instance) {
    std::vector<types::FunctionParam> allParams;
    if (kind != types::MethodKind::Static) {
        allParams.emplace_back(kind == types::MethodKind::Class ? "cls" : "self", nullptr);
    }
    for (auto& param : params) {
        allParams.push_back(std::move(param));
    }
    return makeFunction(name, std::move(allParams), std::move(returnType), kind);
}

inline types::Symbol* addMethod(const types::ClassTypePtr& classType, const types::FunctionTypePtr& method) {
    auto symbol = std::make_unique<types::Symbol>(types::SymbolFlags::ClassMember);
    symbol->addDeclaration(types::Declaration::function(method));
    return classType->getDetailsPtr()->addField(method->getName(), std::move(symbol));
}

// Annotated variable, e.g. "x: int" in a class body
inline types::Symbol* addVariable(const types::ClassTypePtr& classType, const std::string& name,
                                  types::TypePtr type, uint32_t flags = types::SymbolFlags::ClassMember,
                                  bool isFinal = false) {
    auto symbol = std::make_unique<types::Symbol>(flags);
    symbol->addDeclaration(types::Declaration::variable(std::move(type), isFinal));
    return classType->getDetailsPtr()->addField(name, std::move(symbol));
}

// Unannotated variable whose type comes from its assigned value
inline types::Symbol* addInferredVariable(const types::ClassTypePtr& classType, const std::string& name,
                                          types::TypePtr inferredType,
                                          uint32_t flags = types::SymbolFlags::ClassMember, bool isFinal = false) {
    auto symbol = std::make_unique<types::Symbol>(flags);
    symbol->addDeclaration(types::Declaration::inferredVariable(std::move(inferredType), isFinal));
    return classType->getDetailsPtr()->addField(name, std::move(symbol));
}

inline types::Symbol* addProperty(const types::ClassTypePtr& classType, const std::string& name,
                                  const types::ClassTypePtr& propertyObject) {
    return classType->getDetailsPtr()->addField(
        name, types::Symbol::createWithType(types::SymbolFlags::ClassMember, propertyObject));
}

inline types::Symbol* addModuleFunction(types::SymbolTable& fields, const types::FunctionTypePtr& function) {
    auto symbol = std::make_unique<types::Symbol>(types::SymbolFlags::None);
    symbol->addDeclaration(types::Declaration::function(function));
    return fields.insert(function->getName(), std::move(symbol));
}

inline types::Symbol* addModuleVariable(types::SymbolTable& fields, const std::string& name, types::TypePtr type) {
    auto symbol = std::make_unique<types::Symbol>(types::SymbolFlags::None);
    symbol->addDeclaration(types::Declaration::variable(std::move(type)));
    return fields.insert(name, std::move(symbol));
}

inline types::TypePtr instanceOf(const types::ClassTypePtr& classType) {
    return types::ClassType::cloneAsInstance(*classType);
}

inline types::TypePtr specialize(const types::ClassTypePtr& classType, std::vector<types::TypePtr> typeArgs) {
    return types::ClassType::cloneAsInstance(
        *types::ClassType::cloneForSpecialization(*classType, std::move(typeArgs), true));
}

// True if any note of any reported entry contains text
inline bool hasNote(const ErrorReporter& reporter, const std::string& text) {
    for (const auto& error : reporter.getErrors()) {
        for (const auto& note : error.notes) {
            if (note.find(text) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

} // namespace test
} // namespace protocheck
