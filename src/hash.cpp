#include "assay/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. stdout/stderr digests, the env
//      fingerprint and the ledger chain all go through this file.
//   2. Output digests (stdout_hash / stderr_hash) are plain, undomained
//      BLAKE3 over the persisted bytes so anyone can recompute them with
//      `b3sum stdout.log`.
//   3. Derived digests use a domain prefix ("env:", "ledger:").

#include <array>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace assay {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_file_blake3_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);

  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer_size);
    std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
    }
  }

  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string env_fingerprint_hash(std::string_view canonical_env) {
  return hash_domain("env:", canonical_env);
}

std::string ledger_chain_hash(std::string_view ledger_line) {
  return hash_domain("ledger:", ledger_line);
}

}  // namespace assay
