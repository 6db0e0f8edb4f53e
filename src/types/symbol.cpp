#include "protocheck/types/symbol.h"

namespace protocheck {
namespace types {

Declaration Declaration::variable(TypePtr annotation, bool final) {
    return Declaration(DeclarationType::Variable, std::move(annotation), final);
}

Declaration Declaration::inferredVariable(TypePtr inferred, bool final) {
    Declaration decl(DeclarationType::Variable, nullptr, final);
    decl.inferredType = std::move(inferred);
    return decl;
}

Declaration Declaration::function(TypePtr functionType) {
    return Declaration(DeclarationType::Function, std::move(functionType));
}

Declaration Declaration::classDecl(TypePtr classType) {
    return Declaration(DeclarationType::Class, std::move(classType));
}

std::unique_ptr<Symbol> Symbol::createWithType(uint32_t flags, TypePtr type) {
    auto symbol = std::make_unique<Symbol>(flags);
    symbol->synthesizedType_ = std::move(type);
    return symbol;
}

std::vector<const Declaration*> Symbol::getTypedDeclarations() const {
    std::vector<const Declaration*> result;
    for (const auto& decl : declarations_) {
        if (decl.hasTypedDeclaration()) {
            result.push_back(&decl);
        }
    }
    return result;
}

bool Symbol::hasTypedDeclarations() const {
    if (synthesizedType_) {
        return true;
    }
    for (const auto& decl : declarations_) {
        if (decl.hasTypedDeclaration()) {
            return true;
        }
    }
    return false;
}

bool Symbol::isFinalVariable() const {
    for (const Declaration* decl : getTypedDeclarations()) {
        if (decl->type == DeclarationType::Variable && decl->isFinal) {
            return true;
        }
    }
    return false;
}

Symbol* SymbolTable::insert(const std::string& name, std::unique_ptr<Symbol> symbol) {
    if (!symbol) {
        return nullptr;
    }
    Symbol* raw = symbol.get();
    auto result = symbols_.insert(std::make_pair(name, std::move(symbol)));
    if (!result.second) {
        return nullptr;
    }
    return raw;
}

Symbol* SymbolTable::lookup(llvm::StringRef name) const {
    auto it = symbols_.find(name.str());
    if (it == symbols_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace types
} // namespace protocheck
