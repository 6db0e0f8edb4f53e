#pragma once

#include "protocheck/source_location.h"
#include <llvm/ADT/MapVector.h>
#include <llvm/ADT/StringRef.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace protocheck {
namespace types {

class Type;
using TypePtr = std::shared_ptr<const Type>;

enum class DeclarationType {
    Variable,
    Parameter,
    Function,
    Class
};

// One declaration of a symbol. Function and class declarations always carry
// their type in typeAnnotation; variables only when explicitly annotated.
// A Final variable counts as typed even without an annotation; its declared
// type is then the inferred one.
struct Declaration {
    DeclarationType type = DeclarationType::Variable;
    SourceLocation location;
    TypePtr typeAnnotation;
    TypePtr inferredType;
    bool isFinal = false;

    Declaration() = default;
    Declaration(DeclarationType declType, TypePtr annotation, bool final = false)
        : type(declType), typeAnnotation(std::move(annotation)), isFinal(final) {}

    bool hasTypedDeclaration() const {
        return type == DeclarationType::Function || type == DeclarationType::Class || typeAnnotation != nullptr ||
               (type == DeclarationType::Variable && isFinal);
    }

    // Annotated variable declaration, e.g. "x: int"
    static Declaration variable(TypePtr annotation, bool final = false);
    // Unannotated variable declaration, e.g. "x = 3"
    static Declaration inferredVariable(TypePtr inferred, bool final = false);
    static Declaration function(TypePtr functionType);
    static Declaration classDecl(TypePtr classType);
};

namespace SymbolFlags {
    constexpr uint32_t None = 0;
    // Declared in the class body
    constexpr uint32_t ClassMember = 1 << 0;
    // Assigned through "self" in a method
    constexpr uint32_t InstanceMember = 1 << 1;
    // Annotated as ClassVar
    constexpr uint32_t ClassVar = 1 << 2;
    // Synthesized members that never take part in protocol matching
    constexpr uint32_t IgnoredForProtocolMatch = 1 << 3;
}

class Symbol {
public:
    explicit Symbol(uint32_t flags) : flags_(flags) {}

    // Symbol whose only declaration is a synthesized, already-typed one
    static std::unique_ptr<Symbol> createWithType(uint32_t flags, TypePtr type);

    uint32_t getFlags() const { return flags_; }
    bool isClassMember() const { return (flags_ & SymbolFlags::ClassMember) != 0; }
    bool isInstanceMember() const { return (flags_ & SymbolFlags::InstanceMember) != 0; }
    bool isClassVar() const { return (flags_ & SymbolFlags::ClassVar) != 0; }
    bool isIgnoredForProtocolMatch() const { return (flags_ & SymbolFlags::IgnoredForProtocolMatch) != 0; }

    void addDeclaration(Declaration declaration) { declarations_.push_back(std::move(declaration)); }
    const std::vector<Declaration>& getDeclarations() const { return declarations_; }
    std::vector<const Declaration*> getTypedDeclarations() const;
    bool hasTypedDeclarations() const;

    const TypePtr& getSynthesizedType() const { return synthesizedType_; }

    // True if any typed declaration is a Final variable
    bool isFinalVariable() const;

private:
    uint32_t flags_;
    std::vector<Declaration> declarations_;
    TypePtr synthesizedType_;
};

// Insertion-ordered table of uniquely named symbols. Iteration order is the
// declaration order and is observable in diagnostics.
class SymbolTable {
public:
    using SymbolMap = llvm::MapVector<std::string, std::unique_ptr<Symbol>,
                                      std::map<std::string, unsigned>>;
    using const_iterator = SymbolMap::const_iterator;

    SymbolTable() = default;
    SymbolTable(const SymbolTable&) = delete;
    SymbolTable& operator=(const SymbolTable&) = delete;

    // Returns the inserted symbol, or nullptr if the name already exists
    Symbol* insert(const std::string& name, std::unique_ptr<Symbol> symbol);

    Symbol* lookup(llvm::StringRef name) const;
    bool contains(llvm::StringRef name) const { return lookup(name) != nullptr; }

    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }

    const_iterator begin() const { return symbols_.begin(); }
    const_iterator end() const { return symbols_.end(); }

private:
    SymbolMap symbols_;
};

} // namespace types
} // namespace protocheck
