#include "protocheck/error_reporter.h"
#include "protocheck/diagnostic.h"
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>
#include <iostream>

namespace protocheck {

namespace {

const char* levelName(ErrorLevel level) {
    switch (level) {
        case ErrorLevel::Error: return "error";
        case ErrorLevel::Warning: return "warning";
    }
    return "error";
}

} // namespace

void ErrorReporter::setSource(const std::string& file, const std::string& source) {
    llvm::SmallVector<llvm::StringRef, 64> parts;
    llvm::StringRef(source).split(parts, '\n', -1, true);

    std::vector<std::string>& lines = sourceLines_[file];
    lines.clear();
    lines.reserve(parts.size());
    for (llvm::StringRef part : parts) {
        lines.push_back(part.rtrim('\r').str());
    }
}

size_t ErrorReporter::visualColumn(const std::string& line, size_t column) const {
    size_t visual = 0;
    for (size_t i = 0; i < line.size() && i < column; ++i) {
        visual = line[i] == '\t' ? (visual / tabWidth_ + 1) * tabWidth_ : visual + 1;
    }
    return visual;
}

CheckerError& ErrorReporter::record(ErrorLevel level, const SourceLocation& location, const std::string& message,
                                    const ErrorCode& code) {
    errors_.emplace_back(level, location, message, code);
    CheckerError& err = errors_.back();

    auto it = sourceLines_.find(location.getFile());
    if (it != sourceLines_.end() && location.isValid() && location.getLine() <= it->second.size()) {
        err.sourceLine = it->second[location.getLine() - 1];
        err.underlineStart = visualColumn(err.sourceLine, location.getColumn() - 1);
    }
    return err;
}

void ErrorReporter::error(const SourceLocation& location, const std::string& message, const ErrorCode& code) {
    record(ErrorLevel::Error, location, message, code);
    ++errorCount_;
}

void ErrorReporter::warning(const SourceLocation& location, const std::string& message, const ErrorCode& code) {
    record(ErrorLevel::Warning, location, message, code);
    ++warningCount_;
}

void ErrorReporter::addNote(const std::string& note) {
    if (!errors_.empty()) {
        errors_.back().notes.push_back(note);
    }
}

void ErrorReporter::addNotes(const DiagnosticAddendum& addendum, int maxDepth, int maxLineCount) {
    if (errors_.empty()) {
        return;
    }
    std::vector<std::string> lines = addendum.getLines(maxDepth, maxLineCount);
    std::vector<std::string>& notes = errors_.back().notes;
    notes.insert(notes.end(), lines.begin(), lines.end());
}

std::string ErrorReporter::formatError(const CheckerError& err) const {
    std::string text;
    llvm::raw_string_ostream os(text);

    os << levelName(err.level);
    if (!err.errorCode.empty()) {
        os << "[" << err.errorCode.code << "]";
    }
    os << ": " << err.location.toString() << ": " << err.message << "\n";

    if (!err.sourceLine.empty()) {
        std::string expanded;
        for (char ch : err.sourceLine) {
            if (ch == '\t') {
                expanded.append(tabWidth_ - expanded.size() % tabWidth_, ' ');
            } else {
                expanded.push_back(ch);
            }
        }
        os << llvm::format_decimal(err.location.getLine(), 6) << " | " << expanded << "\n";
        os << "       | " << std::string(err.underlineStart, ' ') << "^\n";
    }

    // Addendum lines keep their own indentation
    for (const auto& note : err.notes) {
        os << "  note:" << note << "\n";
    }

    return os.str();
}

void ErrorReporter::printErrors() const {
    printErrors(std::cerr);
}

void ErrorReporter::printErrors(std::ostream& os) const {
    for (const auto& err : errors_) {
        os << formatError(err) << "\n";
    }
}

void ErrorReporter::clear() {
    errors_.clear();
    errorCount_ = 0;
    warningCount_ = 0;
    sourceLines_.clear();
}

} // namespace protocheck
