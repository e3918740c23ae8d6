#pragma once

#include <string>
#include <vector>

namespace ldp::security {

/// Digest and encoding helpers over OpenSSL EVP.
/// Used to fingerprint deployment packages and API definitions.
/// Class abbreviation: N/A (static interface)
class CryptoService {
 public:
  /// SHA-256 hash -> 64-char lowercase hex string.
  static std::string sha256Hex(const std::string& sInput);

  /// SHA-256 hash -> standard base64 (44 chars), the form Lambda reports as CodeSha256.
  static std::string sha256Base64(const std::string& sInput);

  /// Standard base64 with padding and no line breaks.
  static std::string base64Encode(const std::string& sData);

 private:
  static std::vector<unsigned char> sha256(const std::string& sInput);
};

}  // namespace ldp::security
