#pragma once

#include <string>
#include <string_view>

namespace settlement::util {

std::string ToHex(std::string_view bytes);

// Throws InvalidInput on odd length or non-hex characters.
std::string FromHex(std::string_view hex);

} // namespace settlement::util
