#include "fingerprint.hpp"

#include <cryptopp/sha.h>

#include <array>
#include <iomanip>
#include <sstream>
#include <string>

namespace fingerprint {

namespace {

template <std::size_t N>
std::string bytesToHex(std::array<CryptoPP::byte, N> const &bytes) {
  std::stringstream ss;
  for (const auto &byte : bytes) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(byte);
  }
  return ss.str();
}

template <typename Hash> std::string digestHex(std::string_view data) {
  Hash hasher;
  hasher.Update(reinterpret_cast<const CryptoPP::byte *>(data.data()),
                data.size());
  std::array<CryptoPP::byte, Hash::DIGESTSIZE> digest;
  hasher.Final(digest.data());
  return bytesToHex(digest);
}

} // namespace

std::string sha1Hex(std::string_view data) {
  return digestHex<CryptoPP::SHA1>(data);
}

std::string sha256Hex(std::string_view data) {
  return digestHex<CryptoPP::SHA256>(data);
}

struct Fingerprint::State {
  CryptoPP::SHA256 hasher;
};

Fingerprint::Fingerprint() : state(std::make_unique<State>()) {}

Fingerprint::~Fingerprint() = default;

Fingerprint &Fingerprint::add(std::string_view field) {
  // length prefix, so a '|' inside a field cannot shift the field boundaries
  const std::string length = std::to_string(field.size()) + ":";
  state->hasher.Update(reinterpret_cast<const CryptoPP::byte *>(length.data()),
                       length.size());
  state->hasher.Update(reinterpret_cast<const CryptoPP::byte *>(field.data()),
                       field.size());
  state->hasher.Update(reinterpret_cast<const CryptoPP::byte *>("|"), 1);
  return *this;
}

Fingerprint &Fingerprint::endRecord() {
  state->hasher.Update(reinterpret_cast<const CryptoPP::byte *>("\n"), 1);
  return *this;
}

std::string Fingerprint::hex() {
  std::array<CryptoPP::byte, CryptoPP::SHA256::DIGESTSIZE> digest;
  state->hasher.Final(digest.data());
  return bytesToHex(digest);
}

} // namespace fingerprint
