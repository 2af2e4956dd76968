#pragma once

#include <openssl/evp.h>
#include <xxhash.h>

#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fsclean {

inline namespace detail_v1_0_0 {

/**
 * @brief content digest plus byte size of one file,
 * two files are duplicates iff their fingerprints are equal.
 */
struct fingerprint_t {
  std::vector<unsigned char> digest;
  uint64_t size = 0;

  std::strong_ordering operator<=>(const fingerprint_t &rhs) const = default;
  bool operator==(const fingerprint_t &rhs) const = default;

  std::string hex() const;
};

/**
 * @brief look up a digest supported by libcrypto
 *
 * @param name digest name ex. sha256, sha512, blake2b512
 * @return digest, never null
 * @throws std::invalid_argument if unknown or shorter than 256 bits
 */
const EVP_MD *digest_by_name(const std::string &name);

/**
 * @brief stream the whole file through the digest in bounded chunks
 *
 * @param path file to hash
 * @param md digest from digest_by_name()
 * @return fingerprint, std::nullopt if the file cannot be opened or read
 * @throws std::runtime_error on libcrypto failure
 */
std::optional<fingerprint_t> fingerprint(const std::filesystem::path &path,
                                         const EVP_MD *md);

/**
 * @brief xxhash of the first head_blk_sz bytes, used as a cheap
 * pre-filter between files of equal size
 *
 * @return hash, std::nullopt if the file cannot be opened or read
 */
std::optional<XXH128_hash_t> head_hash(const std::filesystem::path &path);

}  // namespace detail_v1_0_0

}  // namespace fsclean
