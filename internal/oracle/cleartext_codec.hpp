#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace settlement::oracle {

// Oracle cleartexts: a sequence of 8-byte big-endian unsigned words, one
// per requested handle, in request order.
inline constexpr std::size_t kWordBytes = 8;

std::string EncodeWords(const std::vector<std::uint64_t>& words);

// MalformedPayload when the length is not a multiple of kWordBytes.
std::vector<std::uint64_t> DecodeWords(std::string_view cleartexts);

} // namespace settlement::oracle
