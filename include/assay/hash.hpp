#pragma once

#include <string>
#include <string_view>

namespace assay {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Stream-hash a file with a 64 KB read buffer and return a 64-char hex
// digest. Equivalent to blake3_hex(read_file(path)). Returns an empty string
// when the file cannot be opened.
std::string hash_file_blake3_hex(const std::string& path);

// Domain-separated hashing. The ledger chain and the env fingerprint use
// distinct prefixes so a digest from one context never verifies in another.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string env_fingerprint_hash(std::string_view canonical_env);
std::string ledger_chain_hash(std::string_view ledger_line);

}  // namespace assay
