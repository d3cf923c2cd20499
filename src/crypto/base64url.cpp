#include <couponguard/crypto/base64url.hpp>

#include <openssl/evp.h>

#include <algorithm>

namespace couponguard::crypto {

namespace {

bool is_base64url_char(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_';
}

}  // namespace

std::string base64url_encode(const couponguard::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return {};
  }
  auto buffer = std::string(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  auto written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.data()),
                      bytes.data(), static_cast<int>(bytes.size()));
  buffer.resize(static_cast<size_t>(written));
  while (!buffer.empty() && buffer.back() == '=') {
    buffer.pop_back();
  }
  std::replace(std::begin(buffer), std::end(buffer), '+', '-');
  std::replace(std::begin(buffer), std::end(buffer), '/', '_');
  return buffer;
}

std::optional<couponguard::schema::bytes_t> try_base64url_decode(
    std::string_view text) {
  if (text.empty()) {
    return couponguard::schema::bytes_t{};
  }
  if ((text.size() % 4) == 1 ||
      !std::all_of(std::begin(text), std::end(text), is_base64url_char)) {
    return std::nullopt;
  }

  auto padded = std::string{text};
  std::replace(std::begin(padded), std::end(padded), '-', '+');
  std::replace(std::begin(padded), std::end(padded), '_', '/');
  auto padding = (4 - (padded.size() % 4)) % 4;
  padded.append(padding, '=');

  auto decoded = couponguard::schema::bytes_t(3 * (padded.size() / 4));
  auto written =
      EVP_DecodeBlock(decoded.data(),
                      reinterpret_cast<const unsigned char*>(padded.data()),
                      static_cast<int>(padded.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  decoded.resize(static_cast<size_t>(written) - padding);

  // Non-zero trailing bits decode to the same bytes as the canonical form.
  if (base64url_encode(decoded) != text) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace couponguard::crypto
