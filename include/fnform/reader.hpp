#pragma once
#include "fnform/node.hpp"
#include "fnform/error.hpp"
#include <llvm/Support/Error.h>
#include <string_view>
#include <vector>

namespace fnform {

// Read exactly one form from source text. Nodes carry line/col/end-line/end-col
// metadata. Failures are read_error values.
llvm::Expected<node_ptr> read(std::string_view src, std::string_view source_name = "<memory>");

// Read every top-level form, in order. Empty (or comment-only) input yields no forms.
llvm::Expected<std::vector<node_ptr>> read_all(std::string_view src, std::string_view source_name = "<memory>");

} // namespace fnform
