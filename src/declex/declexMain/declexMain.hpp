#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/raw_ostream.h>

#include <istream>
#include <string_view>

namespace declex
{
/**
 * Explains every declaration given in elements. Without declarations a session reading one line of declarations at a
 * time from input is started
 *
 * Explanations are written to out, diagnostics to reporter. Returns 0 if all inputs could be explained
 */
int main(llvm::MutableArrayRef<std::string_view> elements, std::istream& input,
         llvm::raw_ostream* reporter = &llvm::errs(), llvm::raw_ostream* out = &llvm::outs());
} // namespace declex
