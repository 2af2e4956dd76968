#pragma once

#include <cstdint>

#define FSCLEAN_EXPORT __attribute__((visibility("default")))

namespace fsclean {

// 4KiB, head block for xxhash pre-filter
constexpr auto head_blk_sz = 4096UL;
// 1MiB, read buffer for full digest
constexpr auto buf_sz = 1024UL * 1024UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

// 256bit digest, 128bit collision resistance
constexpr auto min_digest_sz = 32;
constexpr auto default_hash_algo = "sha256";
constexpr auto default_max_thread = 4U;
constexpr auto default_changelog = "changelog.json";

constexpr auto description = "fsclean v1.1";

// changelog format version
constexpr int changelog_version = 2;

}  // namespace fsclean
