#include "utils/address.hpp"
#include "utils/hex.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"
#include <cctype>

namespace {
  bool HasAddressShape(const std::string& text) {
    if (text.size() != 42 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) return false;
    for (size_t i = 2; i < text.size(); ++i) {
      if (HexNibble(text[i]) < 0) return false;
    }
    return true;
  }

  std::string ChecksumOfShaped(const std::string& text) {
    const std::string lower = ToLowerHex(Strip0x(text));
    const std::string hash = Strip0x(Crypto::Keccak256Raw(lower));
    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); ++i) {
      char c = lower[i];
      if (c >= 'a' && c <= 'f' && HexNibble(hash[i]) >= 8) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      out += c;
    }
    return out;
  }
}

namespace Address {
  bool IsValid(const std::string& text) {
    if (!HasAddressShape(text)) return false;
    const std::string digits = text.substr(2);
    bool has_lower = false, has_upper = false;
    for (unsigned char c : digits) {
      if (std::islower(c)) has_lower = true;
      if (std::isupper(c)) has_upper = true;
    }
    if (!(has_lower && has_upper)) return true;
    return ChecksumOfShaped(text).substr(2) == digits;
  }

  std::string Normalize(const std::string& text) {
    if (!IsValid(text)) throw ConfigurationError("expected address, got `" + text + "`");
    return "0x" + ToLowerHex(text.substr(2));
  }

  std::string ToChecksum(const std::string& text) {
    if (!HasAddressShape(text)) throw ConfigurationError("expected address, got `" + text + "`");
    return ChecksumOfShaped(text);
  }

  bool Equal(const std::string& a, const std::string& b) {
    return ToLowerHex(Strip0x(a)) == ToLowerHex(Strip0x(b));
  }

  uint256_t ToWord(const std::string& text) {
    const std::string lower = Normalize(text);
    uint256_t word = 0;
    for (size_t i = 2; i < lower.size(); ++i) word = (word << 4) | static_cast<unsigned>(HexNibble(lower[i]));
    return word;
  }

  std::string FromWord(const uint256_t& word) {
    static const char* hex = "0123456789abcdef";
    std::string out(42, '0');
    out[1] = 'x';
    uint256_t v = word;
    for (size_t i = 41; i >= 2; --i) {
      out[i] = hex[static_cast<unsigned>(v & 0xF)];
      v >>= 4;
    }
    return out;
  }
}
