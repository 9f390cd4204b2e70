/**
 * @file DocumentErrors.h
 * @brief Exceptions raised by Document history and export validation
 */
#ifndef PARTCAD_APP_DOCUMENT_DOCUMENTERRORS_H
#define PARTCAD_APP_DOCUMENT_DOCUMENTERRORS_H

#include <stdexcept>
#include <string>

namespace partcad::app {

class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const std::string& message)
        : std::runtime_error(message) {}
};

class NoHistoryError : public DocumentError {
public:
    NoHistoryError()
        : DocumentError("No actions to undo.") {}
};

class NoRedoError : public DocumentError {
public:
    NoRedoError()
        : DocumentError("No actions to redo.") {}
};

class UnsupportedFormatError : public DocumentError {
public:
    explicit UnsupportedFormatError(const std::string& format)
        : DocumentError("Format " + format + " is not supported."), format_(format) {}

    const std::string& format() const { return format_; }

private:
    std::string format_;
};

} // namespace partcad::app

#endif // PARTCAD_APP_DOCUMENT_DOCUMENTERRORS_H
