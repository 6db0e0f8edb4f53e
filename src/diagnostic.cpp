#include "protocheck/diagnostic.h"

namespace protocheck {

// Guards against pathological trees, independent of the caller's depth limit
static constexpr int maxAddendumRecursionCount = 64;

std::string MessageTemplate::format(const Params& params) const {
    llvm::StringRef text(text_);
    std::string result;
    result.reserve(text.size() + 32);

    while (!text.empty()) {
        size_t open = text.find('{');
        if (open == llvm::StringRef::npos) {
            result.append(text.begin(), text.end());
            break;
        }
        result.append(text.begin(), text.begin() + open);
        size_t close = text.find('}', open);
        if (close == llvm::StringRef::npos) {
            result.append(text.begin() + open, text.end());
            break;
        }

        llvm::StringRef name = text.slice(open + 1, close);
        bool replaced = false;
        for (const auto& param : params) {
            if (param.first == name) {
                result += param.second;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result.append(text.begin() + open, text.begin() + close + 1);
        }
        text = text.drop_front(close + 1);
    }
    return result;
}

namespace Messages {
    MessageTemplate protocolMemberMissing() { return MessageTemplate("\"{name}\" is not present"); }
    MessageTemplate protocolMemberClassVar() { return MessageTemplate("\"{name}\" is not a class variable"); }
    MessageTemplate memberTypeMismatch() { return MessageTemplate("\"{name}\" is an incompatible type"); }
    MessageTemplate memberIsInvariant() { return MessageTemplate("\"{name}\" is invariant because it is mutable"); }
    MessageTemplate memberIsFinalInProtocol() { return MessageTemplate("\"{name}\" is marked Final in protocol"); }
    MessageTemplate memberIsNotFinalInProtocol() { return MessageTemplate("\"{name}\" is not marked Final in protocol"); }
    MessageTemplate typeAssignmentMismatch() {
        return MessageTemplate("Type \"{sourceType}\" cannot be assigned to type \"{destType}\"");
    }
    MessageTemplate typeVarNotSolvable() {
        return MessageTemplate("Type \"{sourceType}\" is incompatible with type variable \"{name}\" (currently \"{destType}\")");
    }
    MessageTemplate typeArgumentMismatch() {
        return MessageTemplate("Type parameter \"{name}\" is {variance}, but \"{sourceType}\" is not compatible with \"{destType}\"");
    }
    MessageTemplate paramAssignment() {
        return MessageTemplate("Parameter {index}: type \"{sourceType}\" cannot be assigned to type \"{destType}\"");
    }
    MessageTemplate functionParamName() {
        return MessageTemplate("Parameter name mismatch: \"{destName}\" versus \"{srcName}\"");
    }
    MessageTemplate functionParamMissing() { return MessageTemplate("Extra parameter \"{name}\""); }
    MessageTemplate functionParamDefaultMissing() { return MessageTemplate("Parameter \"{name}\" is missing default argument"); }
    MessageTemplate functionTooFewParams() {
        return MessageTemplate("Function accepts too few positional parameters; expected {expected} but received {received}");
    }
    MessageTemplate argsParamMissing() { return MessageTemplate("Parameter \"*{name}\" has no corresponding parameter"); }
    MessageTemplate kwargsParamMissing() { return MessageTemplate("Parameter \"**{name}\" has no corresponding parameter"); }
    MessageTemplate functionReturnTypeMismatch() {
        return MessageTemplate("Function return type \"{sourceType}\" is incompatible with type \"{destType}\"");
    }
    MessageTemplate overloadNotAssignable() { return MessageTemplate("No overloaded function matches type \"{type}\""); }
    MessageTemplate missingGetter() { return MessageTemplate("Property getter method is missing"); }
    MessageTemplate missingSetter() { return MessageTemplate("Property setter method is missing"); }
    MessageTemplate missingDeleter() { return MessageTemplate("Property deleter method is missing"); }
    MessageTemplate propertyAccessorMismatch() { return MessageTemplate("Property {accessor} method is incompatible"); }
    MessageTemplate typeIncompatible() {
        return MessageTemplate("Type \"{sourceType}\" is incompatible with declared type \"{destType}\"");
    }
    MessageTemplate protocolIncompatible() {
        return MessageTemplate("\"{sourceType}\" is incompatible with protocol \"{destType}\"");
    }
    MessageTemplate moduleProtocolIncompatible() {
        return MessageTemplate("Module \"{sourceType}\" is incompatible with protocol \"{destType}\"");
    }
    MessageTemplate protocolVarianceCovariant() {
        return MessageTemplate("Type variable \"{variable}\" used in generic protocol \"{class}\" should be covariant");
    }
    MessageTemplate protocolVarianceContravariant() {
        return MessageTemplate("Type variable \"{variable}\" used in generic protocol \"{class}\" should be contravariant");
    }
    MessageTemplate protocolVarianceInvariant() {
        return MessageTemplate("Type variable \"{variable}\" used in generic protocol \"{class}\" should be invariant");
    }
}

void DiagnosticAddendum::addMessage(const std::string& message) {
    messages_.push_back(message);
}

DiagnosticAddendum* DiagnosticAddendum::createAddendum() {
    childAddenda_.push_back(std::make_unique<DiagnosticAddendum>());
    return childAddenda_.back().get();
}

bool DiagnosticAddendum::isEmpty() const {
    if (!messages_.empty()) {
        return false;
    }
    for (const auto& child : childAddenda_) {
        if (!child->isEmpty()) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> DiagnosticAddendum::getLinesRecursive(int maxDepth, int recursionCount) const {
    if (maxDepth <= 0 || recursionCount > maxAddendumRecursionCount) {
        return {};
    }

    std::vector<std::string> childLines;
    for (const auto& child : childAddenda_) {
        int maxDepthRemaining = messages_.empty() ? maxDepth : maxDepth - 1;
        std::vector<std::string> lines = child->getLinesRecursive(maxDepthRemaining, recursionCount + 1);
        childLines.insert(childLines.end(), lines.begin(), lines.end());
    }

    // Levels without messages don't add indentation
    const std::string extraSpace = messages_.empty() ? "" : "  ";
    std::vector<std::string> result;
    result.reserve(messages_.size() + childLines.size());
    for (const auto& message : messages_) {
        result.push_back(extraSpace + message);
    }
    for (const auto& line : childLines) {
        result.push_back(extraSpace + line);
    }
    return result;
}

std::vector<std::string> DiagnosticAddendum::getLines(int maxDepth, int maxLineCount) const {
    std::vector<std::string> lines = getLinesRecursive(maxDepth, 0);
    if (maxLineCount >= 0 && lines.size() > static_cast<size_t>(maxLineCount)) {
        lines.resize(static_cast<size_t>(maxLineCount));
        lines.push_back("  ...");
    }
    return lines;
}

std::string DiagnosticAddendum::getString(int maxDepth, int maxLineCount) const {
    std::string text;
    for (const auto& line : getLines(maxDepth, maxLineCount)) {
        if (!text.empty()) {
            text += "\n";
        }
        text += line;
    }
    return text;
}

} // namespace protocheck
