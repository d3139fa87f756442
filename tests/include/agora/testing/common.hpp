#pragma once

#include <agora/schema/primitives.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace agora::testing {

/// Distinct 32 byte identity per seed; bytes count up from `seed`.
inline agora::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = agora::schema::hash32_t{};
  std::generate(std::begin(out), std::end(out),
                [next = seed]() mutable { return next++; });
  return out;
}

/// Zero padded label, the same form the CLI accepts for short identities.
inline agora::schema::hash32_t make_label(const std::string_view label) {
  auto out = agora::schema::hash32_t{};
  std::copy_n(std::begin(label), std::min(label.size(), out.size()),
              std::begin(out));
  return out;
}

/// Fresh RocksDB directory under the system temp dir, removed on
/// destruction.  Declare it before the storage that lives in it.
struct temp_directory final {
  explicit temp_directory(const std::string_view prefix) {
    static auto counter = std::atomic<uint64_t>{};
    auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    path = (std::filesystem::temp_directory_path() /
            (std::string{prefix} + "_" + std::to_string(stamp) + "_" +
             std::to_string(counter++)))
               .string();
  }
  ~temp_directory() {
    auto error = std::error_code{};
    std::filesystem::remove_all(path, error);
  }
  temp_directory(const temp_directory&) = delete;
  temp_directory& operator=(const temp_directory&) = delete;

  std::string path;
};

}  // namespace agora::testing
