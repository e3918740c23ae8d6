#include "security/CryptoService.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ldp::security {

// ── SHA-256 ────────────────────────────────────────────────────────────────

std::vector<unsigned char> CryptoService::sha256(const std::string& sInput) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sInput.data(), sInput.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);
  return std::vector<unsigned char>(vHash, vHash + uHashLen);
}

std::string CryptoService::sha256Hex(const std::string& sInput) {
  const auto vHash = sha256(sInput);
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char c : vHash) {
    oss << std::setw(2) << static_cast<int>(c);
  }
  return oss.str();
}

std::string CryptoService::sha256Base64(const std::string& sInput) {
  const auto vHash = sha256(sInput);
  return base64Encode(std::string(vHash.begin(), vHash.end()));
}

// ── Base64 ─────────────────────────────────────────────────────────────────

std::string CryptoService::base64Encode(const std::string& sData) {
  // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
  std::vector<unsigned char> vOut(4 * ((sData.size() + 2) / 3) + 1);
  const int iLen = EVP_EncodeBlock(vOut.data(),
                                   reinterpret_cast<const unsigned char*>(sData.data()),
                                   static_cast<int>(sData.size()));
  if (iLen < 0) {
    throw std::runtime_error("Base64 encode failed");
  }
  return std::string(reinterpret_cast<char*>(vOut.data()), static_cast<size_t>(iLen));
}

}  // namespace ldp::security
