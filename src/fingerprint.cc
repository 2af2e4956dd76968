#include "fingerprint.hh"

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "config.hh"

namespace fsclean {

inline namespace detail_v1_0_0 {

namespace fs = std::filesystem;

namespace {

// RAII wrapper for libcrypto digest context.
class digest_ctx_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit digest_ctx_t(const EVP_MD *md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      EVP_MD_CTX_free(_ctx);
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  ~digest_ctx_t() noexcept { EVP_MD_CTX_free(_ctx); }

  digest_ctx_t(const digest_ctx_t &rhs) = delete;
  digest_ctx_t(digest_ctx_t &&rhs) = delete;
  digest_ctx_t &operator=(const digest_ctx_t &rhs) = delete;
  digest_ctx_t &operator=(digest_ctx_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  std::vector<unsigned char> digest() {
    std::vector<unsigned char> md(EVP_MAX_MD_SIZE);
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(_ctx, md.data(), &md_len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    md.resize(md_len);
    return md;
  }
};

}  // namespace

std::string fingerprint_t::hex() const {
  constexpr auto digits = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (const auto byte : digest) {
    out += digits[byte >> 4];
    out += digits[byte & 0xf];
  }
  return out;
}

const EVP_MD *digest_by_name(const std::string &name) {
  const EVP_MD *md = EVP_get_digestbyname(name.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + name);
  }
  if (EVP_MD_size(md) < min_digest_sz) {
    throw std::invalid_argument("hash algorithm too weak: " + name);
  }
  return md;
}

std::optional<fingerprint_t> fingerprint(const fs::path &path,
                                         const EVP_MD *md) {
  std::error_code ec;
  // a directory opens fine on linux and reads as empty
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  auto buf = std::make_unique<char[]>(buf_sz);
  digest_ctx_t ctx(md);
  uint64_t total = 0;
  while (ifs) {
    ifs.read(buf.get(), (std::streamsize)buf_sz);
    const auto read_len = (uint64_t)ifs.gcount();
    if (read_len > 0) {
      ctx.update(buf.get(), read_len);
      total += read_len;
    }
  }
  if (ifs.bad()) {
    return std::nullopt;
  }
  return fingerprint_t{ctx.digest(), total};
}

std::optional<XXH128_hash_t> head_hash(const fs::path &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return std::nullopt;
  }
  std::array<char, head_blk_sz> buf;
  ifs.read(buf.data(), (std::streamsize)buf.size());
  if (ifs.bad()) {
    return std::nullopt;
  }
  const auto read_len = (size_t)ifs.gcount();
  return XXH3_128bits_withSeed(buf.data(), read_len, hash_seed);
}

}  // namespace detail_v1_0_0

}  // namespace fsclean
