#pragma once

#include <string>
#include <cstddef>

namespace protocheck {

// Position of a declaration in its originating source file. Line and column
// are 1-based; a default-constructed location points at the start of an
// anonymous file.
class SourceLocation {
public:
    SourceLocation()
        : line_(1), column_(1), file_("") {}

    SourceLocation(size_t line, size_t column, const std::string& file = "")
        : line_(line), column_(column), file_(file) {}

    size_t getLine() const { return line_; }
    size_t getColumn() const { return column_; }
    const std::string& getFile() const { return file_; }

    void setLine(size_t line) { line_ = line; }
    void setColumn(size_t column) { column_ = column; }
    void setFile(const std::string& file) { file_ = file; }

    bool isValid() const { return line_ > 0 && column_ > 0; }

    bool operator==(const SourceLocation& other) const {
        return line_ == other.line_ && column_ == other.column_ && file_ == other.file_;
    }
    bool operator!=(const SourceLocation& other) const { return !(*this == other); }

    // "file:line:column", or "line:column" for anonymous sources
    std::string toString() const;

private:
    size_t line_;
    size_t column_;
    std::string file_;
};

} // namespace protocheck
