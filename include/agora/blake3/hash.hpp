#pragma once
#include <agora/schema/primitives.hpp>
#include <blake3.h>
#include <cstdint>
#include <span>
#include <string_view>

namespace agora::blake3 {

/// Incremental BLAKE3 hasher used where several fields feed one digest.
class hasher final {
 public:
  hasher();

  hasher& update(const agora::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  agora::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

agora::schema::hash32_t hash(const std::string_view& str);
agora::schema::hash32_t hash(const agora::schema::bytes_view_t& bytes);

}  // namespace agora::blake3
