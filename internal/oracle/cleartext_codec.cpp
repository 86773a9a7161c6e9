#include "internal/oracle/cleartext_codec.hpp"

#include "internal/util/errors.hpp"

namespace settlement::oracle {

std::string EncodeWords(const std::vector<std::uint64_t>& words) {
  std::string out;
  out.reserve(words.size() * kWordBytes);
  for (auto word : words) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(static_cast<char>((word >> shift) & 0xff));
    }
  }
  return out;
}

std::vector<std::uint64_t> DecodeWords(std::string_view cleartexts) {
  if (cleartexts.size() % kWordBytes != 0) {
    throw util::MalformedPayload("cleartext length " + std::to_string(cleartexts.size()) + " is not a multiple of 8");
  }

  std::vector<std::uint64_t> words;
  words.reserve(cleartexts.size() / kWordBytes);
  for (std::size_t offset = 0; offset < cleartexts.size(); offset += kWordBytes) {
    std::uint64_t word = 0;
    for (std::size_t i = 0; i < kWordBytes; ++i) {
      word = (word << 8) | static_cast<unsigned char>(cleartexts[offset + i]);
    }
    words.push_back(word);
  }
  return words;
}

} // namespace settlement::oracle
