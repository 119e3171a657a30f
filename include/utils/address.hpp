#pragma once
#include <string>
#include "common/int_types.hpp"

// 20-byte account addresses in their 0x-hex text form.
namespace Address {
  // 0x followed by 40 hex digits. All-lower and all-upper digits are accepted as is;
  // mixed case must match the EIP-55 checksum.
  bool IsValid(const std::string& text);

  // Lowercase 0x form; ConfigurationError when !IsValid(text).
  std::string Normalize(const std::string& text);

  // EIP-55 mixed-case encoding of a syntactically valid address.
  std::string ToChecksum(const std::string& text);

  bool Equal(const std::string& a, const std::string& b);

  uint256_t ToWord(const std::string& text);
  // Low 160 bits of word, as lowercase 0x hex.
  std::string FromWord(const uint256_t& word);
}
