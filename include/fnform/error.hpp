// error.hpp - failure values raised by the reader and the definition parsers
#pragma once
#include "fnform/node.hpp"
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <system_error>

namespace fnform {

// Closed set of ways a definition form can be malformed.
enum class form_errc {
    missing_name = 1,     // defn without a leading symbol
    missing_parameters,   // no parameter vector or clause list after the name
    malformed_signature,  // multi-clause form: a clause's params are not a vector
    ambiguous_signature,  // single-clause form: params are not a vector
};

// Stable kebab-case code, used by the JSON diagnostics.
const char* errc_name(form_errc k);

class form_error : public llvm::ErrorInfo<form_error> {
public:
    static char ID;

    form_error(form_errc kind, std::string message, node_ptr offending);

    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    form_errc kind() const { return kind_; }
    const std::string& text() const { return message_; }
    // The form the message talks about; null when there is none (e.g. empty input).
    const node_ptr& offending() const { return offending_; }

private:
    form_errc kind_;
    std::string message_;
    node_ptr offending_;
};

// Text that could not be read into a node tree.
class read_error : public llvm::ErrorInfo<read_error> {
public:
    static char ID;

    read_error(std::string message, std::string source, int line, int column);

    void log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    const std::string& text() const { return message_; }
    const std::string& source() const { return source_; }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    std::string message_;
    std::string source_;
    int line_;
    int column_;
};

// The one factory every parser failure goes through.
llvm::Error make_invalid_argument_error(form_errc kind, std::string message, node_ptr offending = nullptr);

} // namespace fnform
