#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace fingerprint {

// Hex encoded digests, used for stable identifiers and change detection.
std::string sha1Hex(std::string_view data);
std::string sha256Hex(std::string_view data);

// Accumulates length-prefixed fields into a SHA-256 digest.
class Fingerprint {
public:
  Fingerprint();
  ~Fingerprint();

  Fingerprint(Fingerprint const &) = delete;
  Fingerprint &operator=(Fingerprint const &) = delete;

  Fingerprint &add(std::string_view field);
  Fingerprint &endRecord();

  std::string hex();

private:
  struct State;
  std::unique_ptr<State> state;
};

} // namespace fingerprint
