#pragma once

#include <llvm/ADT/StringRef.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace protocheck {

constexpr int defaultMaxDiagnosticDepth = 5;
constexpr int defaultMaxDiagnosticLineCount = 8;

// A message text with named "{param}" placeholders.
class MessageTemplate {
public:
    explicit MessageTemplate(const char* text) : text_(text) {}

    using Params = std::vector<std::pair<llvm::StringRef, std::string>>;

    // Replaces each "{name}" with its value. Unknown placeholders are kept verbatim.
    std::string format(const Params& params) const;

    const char* getText() const { return text_; }

private:
    const char* text_;
};

// Message templates used by the assignability checks
namespace Messages {
    MessageTemplate protocolMemberMissing();
    MessageTemplate protocolMemberClassVar();
    MessageTemplate memberTypeMismatch();
    MessageTemplate memberIsInvariant();
    MessageTemplate memberIsFinalInProtocol();
    MessageTemplate memberIsNotFinalInProtocol();
    MessageTemplate typeAssignmentMismatch();
    MessageTemplate typeVarNotSolvable();
    MessageTemplate typeArgumentMismatch();
    MessageTemplate paramAssignment();
    MessageTemplate functionParamName();
    MessageTemplate functionParamMissing();
    MessageTemplate functionParamDefaultMissing();
    MessageTemplate functionTooFewParams();
    MessageTemplate argsParamMissing();
    MessageTemplate kwargsParamMissing();
    MessageTemplate functionReturnTypeMismatch();
    MessageTemplate overloadNotAssignable();
    MessageTemplate missingGetter();
    MessageTemplate missingSetter();
    MessageTemplate missingDeleter();
    MessageTemplate propertyAccessorMismatch();
    MessageTemplate typeIncompatible();
    MessageTemplate protocolIncompatible();
    MessageTemplate moduleProtocolIncompatible();
    MessageTemplate protocolVarianceCovariant();
    MessageTemplate protocolVarianceContravariant();
    MessageTemplate protocolVarianceInvariant();
}

// Tree of explanatory messages attached to a failed check. Every producer
// takes a nullable pointer; children are only created when a parent exists.
class DiagnosticAddendum {
public:
    DiagnosticAddendum() = default;
    DiagnosticAddendum(const DiagnosticAddendum&) = delete;
    DiagnosticAddendum& operator=(const DiagnosticAddendum&) = delete;

    void addMessage(const std::string& message);

    // Appends a new child node and returns it. The parent keeps ownership.
    DiagnosticAddendum* createAddendum();

    const std::vector<std::string>& getMessages() const { return messages_; }
    const std::vector<std::unique_ptr<DiagnosticAddendum>>& getChildren() const { return childAddenda_; }

    // True if neither this node nor any descendant carries a message
    bool isEmpty() const;

    // Rendered lines, indented two spaces per level that has messages
    std::vector<std::string> getLines(int maxDepth = defaultMaxDiagnosticDepth,
                                      int maxLineCount = defaultMaxDiagnosticLineCount) const;

    // Rendered lines joined with newlines
    std::string getString(int maxDepth = defaultMaxDiagnosticDepth,
                          int maxLineCount = defaultMaxDiagnosticLineCount) const;

private:
    std::vector<std::string> messages_;
    std::vector<std::unique_ptr<DiagnosticAddendum>> childAddenda_;

    std::vector<std::string> getLinesRecursive(int maxDepth, int recursionCount) const;
};

// Child of parent, or nullptr when there is no parent
inline DiagnosticAddendum* createChildAddendum(DiagnosticAddendum* parent) {
    return parent ? parent->createAddendum() : nullptr;
}

} // namespace protocheck
