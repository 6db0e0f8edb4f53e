#pragma once

#include <llvm/ADT/StringMap.h>
#include <iosfwd>
#include <string>
#include <vector>
#include "source_location.h"

namespace protocheck {

class DiagnosticAddendum;

enum class ErrorLevel {
    Error,
    Warning
};

// Error codes reported by the checker front end
namespace ErrorCodes {
    // Assignability errors (E300-E399)
    constexpr const char* TYPE_INCOMPATIBLE = "E300";
    constexpr const char* PROTOCOL_MISMATCH = "E301";
    constexpr const char* MODULE_PROTOCOL_MISMATCH = "E302";

    // Protocol declaration warnings (W100-W199)
    constexpr const char* PROTOCOL_VARIANCE = "W100";
}

struct ErrorCode {
    std::string code;      // "E301"
    std::string category;  // "protocol"

    ErrorCode() = default;
    ErrorCode(const std::string& c, const std::string& cat) : code(c), category(cat) {}

    bool empty() const { return code.empty(); }
};

struct CheckerError {
    ErrorLevel level;
    SourceLocation location;
    std::string message;
    ErrorCode errorCode;
    std::vector<std::string> notes; // One per rendered addendum line

    std::string sourceLine;
    size_t underlineStart = 0; // Visual column after tab expansion

    CheckerError(ErrorLevel lvl, const SourceLocation& loc, const std::string& msg, const ErrorCode& code)
        : level(lvl), location(loc), message(msg), errorCode(code) {}
};

class ErrorReporter {
public:
    ErrorReporter() = default;

    // Registers the text of a checked file so entries can quote the offending line
    void setSource(const std::string& file, const std::string& source);

    void setTabWidth(size_t width) { tabWidth_ = width == 0 ? 1 : width; }
    size_t getTabWidth() const { return tabWidth_; }

    void error(const SourceLocation& location, const std::string& message,
               const ErrorCode& code = ErrorCode());
    void warning(const SourceLocation& location, const std::string& message,
                 const ErrorCode& code = ErrorCode());

    // These attach to the most recent entry and are dropped when there is none
    void addNote(const std::string& note);
    void addNotes(const DiagnosticAddendum& addendum, int maxDepth, int maxLineCount);

    bool hasErrors() const { return errorCount_ > 0; }
    size_t getErrorCount() const { return errorCount_; }
    size_t getWarningCount() const { return warningCount_; }

    const std::vector<CheckerError>& getErrors() const { return errors_; }

    // Renders one entry the way printErrors writes it
    std::string formatError(const CheckerError& err) const;

    void printErrors() const;
    void printErrors(std::ostream& os) const;

    void clear();

private:
    std::vector<CheckerError> errors_;
    size_t errorCount_ = 0;
    size_t warningCount_ = 0;
    size_t tabWidth_ = 4;

    llvm::StringMap<std::vector<std::string>> sourceLines_;

    CheckerError& record(ErrorLevel level, const SourceLocation& location, const std::string& message,
                         const ErrorCode& code);
    size_t visualColumn(const std::string& line, size_t column) const;
};

} // namespace protocheck
