#include "fnform/error.hpp"

namespace fnform {

char form_error::ID = 0;
char read_error::ID = 0;

const char* errc_name(form_errc k){
    switch(k){
        case form_errc::missing_name: return "missing-name";
        case form_errc::missing_parameters: return "missing-parameters";
        case form_errc::malformed_signature: return "malformed-signature";
        case form_errc::ambiguous_signature: return "ambiguous-signature";
    }
    return "unknown";
}

form_error::form_error(form_errc kind, std::string message, node_ptr offending)
    : kind_(kind), message_(std::move(message)), offending_(std::move(offending)) {}

void form_error::log(llvm::raw_ostream& os) const {
    os << message_;
    if(offending_ && line(*offending_) > 0)
        os << " (line " << line(*offending_) << ", col " << col(*offending_) << ")";
}

std::error_code form_error::convertToErrorCode() const {
    return std::make_error_code(std::errc::invalid_argument);
}

read_error::read_error(std::string message, std::string source, int line, int column)
    : message_(std::move(message)), source_(std::move(source)), line_(line), column_(column) {}

void read_error::log(llvm::raw_ostream& os) const {
    os << source_ << ":" << line_ << ":" << column_ << ": " << message_;
}

std::error_code read_error::convertToErrorCode() const {
    return std::make_error_code(std::errc::invalid_argument);
}

llvm::Error make_invalid_argument_error(form_errc kind, std::string message, node_ptr offending){
    return llvm::make_error<form_error>(kind, std::move(message), std::move(offending));
}

} // namespace fnform
