#pragma once

#include <string>
#include <string_view>

namespace sszgen::codegen {

/// Snake-case form of a case name, usable as a GoogleTest test name.
///
/// Words break at non-alphanumeric characters, at lower-to-upper
/// transitions and before the last capital of an upper-case run that is
/// followed by a lower-case letter. Digits stay with the preceding word.
/// `ComplexTestStruct_random_3` becomes `complex_test_struct_random_3`.
std::string to_snake_case(std::string_view name);

}  // namespace sszgen::codegen
