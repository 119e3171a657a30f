#include "math/decimal.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <cctype>

using boost::multiprecision::cpp_int;

namespace {
  cpp_int Pow10Big(unsigned n) {
    cpp_int out = 1;
    for (unsigned i = 0; i < n; ++i) out *= 10;
    return out;
  }

  bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) if (!std::isdigit(c)) return false;
    return true;
  }

  // cpp_int's string constructor reads a leading 0 as octal, so digits are accumulated by hand.
  cpp_int FromDecimalDigits(const std::string& digits) {
    cpp_int out = 0;
    for (char c : digits) out = out * 10 + (c - '0');
    return out;
  }

  cpp_int ParseHexMagnitude(const std::string& text) {
    const std::string digits = Strip0x(text);
    if (digits.empty() || digits.size() > 64) throw ConfigurationError("invalid hex integer: " + text);
    cpp_int out = 0;
    for (char c : digits) {
      int v = HexNibble(c);
      if (v < 0) throw ConfigurationError("invalid hex integer: " + text);
      out = (out << 4) | v;
    }
    return out;
  }
}

namespace Decimal {
  cpp_int ParseScaled(const std::string& text, unsigned scale, Rounding rounding) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
      negative = text[pos] == '-';
      ++pos;
    }
    size_t mantissa_end = text.find_first_of("eE", pos);
    std::string mantissa = text.substr(pos, mantissa_end == std::string::npos ? std::string::npos : mantissa_end - pos);
    long exponent = 0;
    if (mantissa_end != std::string::npos) {
      std::string exp_text = text.substr(mantissa_end + 1);
      bool exp_negative = false;
      if (!exp_text.empty() && (exp_text[0] == '-' || exp_text[0] == '+')) {
        exp_negative = exp_text[0] == '-';
        exp_text = exp_text.substr(1);
      }
      if (!AllDigits(exp_text) || exp_text.size() > 4) throw ConfigurationError("invalid number: " + text);
      exponent = std::stol(exp_text);
      if (exp_negative) exponent = -exponent;
    }

    std::string int_part = mantissa, frac_part;
    auto dot = mantissa.find('.');
    if (dot != std::string::npos) {
      int_part = mantissa.substr(0, dot);
      frac_part = mantissa.substr(dot + 1);
    }
    if (int_part.empty() && frac_part.empty()) throw ConfigurationError("invalid number: " + text);
    if ((!int_part.empty() && !AllDigits(int_part)) || (!frac_part.empty() && !AllDigits(frac_part))) {
      throw ConfigurationError("invalid number: " + text);
    }

    cpp_int digits = FromDecimalDigits(int_part + frac_part);
    long shift = exponent + static_cast<long>(scale) - static_cast<long>(frac_part.size());
    if (shift > 256 || shift < -256) throw ConfigurationError("number out of range: " + text);

    cpp_int value;
    if (shift >= 0) {
      value = digits * Pow10Big(static_cast<unsigned>(shift));
    } else {
      cpp_int divisor = Pow10Big(static_cast<unsigned>(-shift));
      if (rounding == Rounding::Exact && digits % divisor != 0) {
        throw ConfigurationError("number has more precision than 1e-" + std::to_string(scale) + ": " + text);
      }
      value = digits / divisor;
    }
    return negative ? cpp_int(-value) : value;
  }

  uint256_t ParseUint256(const std::string& text) {
    cpp_int value;
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
      value = ParseHexMagnitude(text);
    } else {
      if (!AllDigits(text)) throw ConfigurationError("invalid unsigned integer: " + text);
      value = FromDecimalDigits(text);
    }
    if (value >= (cpp_int(1) << 256)) {
      throw ConfigurationError("integer exceeds uint256: " + text);
    }
    return static_cast<uint256_t>(value);
  }

  int256_t ParseInt256(const std::string& text) {
    cpp_int value;
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
      // Hex words are two's complement, as an eth_call return would be.
      cpp_int word = ParseHexMagnitude(text);
      if (bit_test(word, 255)) word -= cpp_int(1) << 256;
      value = word;
    } else {
      std::string digits = text;
      bool negative = false;
      if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        negative = digits[0] == '-';
        digits = digits.substr(1);
      }
      if (!AllDigits(digits)) throw ConfigurationError("invalid signed integer: " + text);
      value = FromDecimalDigits(digits);
      if (negative) value = -value;
    }
    if (value > (cpp_int(1) << 255) - 1 || value < -(cpp_int(1) << 255)) {
      throw ConfigurationError("integer exceeds int256: " + text);
    }
    return static_cast<int256_t>(value);
  }

  std::string ToHexWord(const uint256_t& word) {
    static const char* hex = "0123456789abcdef";
    std::string out(66, '0');
    out[1] = 'x';
    uint256_t v = word;
    for (size_t i = 65; i >= 2; --i) {
      out[i] = hex[static_cast<unsigned>(v & 0xF)];
      v >>= 4;
    }
    return out;
  }
}
