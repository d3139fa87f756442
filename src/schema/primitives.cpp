#include <agora/common/critical.hpp>
#include <agora/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>

namespace agora::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.starts_with("0x") || input.starts_with("0X")) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_value(const char c) {
  auto position = kHexDigits.find(
      static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

std::optional<uint8_t> base64_value(const char c) {
  auto position = kBase64Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    agora::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& text) {
  auto hex = strip_hex_prefix(text);
  if (hex.size() == 64) {
    auto decoded = try_from_hex(hex);
    if (decoded) {
      return make_hash32(*decoded);
    }
  }
  if (text.empty() || text.size() > 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(text), std::end(text), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_zero(const hash32_t& hash) {
  return std::all_of(std::begin(hash), std::end(hash),
                     [](const uint8_t b) { return b == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    out.push_back(kHexDigits[(b >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[b & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = strip_hex_prefix(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  for (auto i = std::size_t{0}; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return out;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (auto i = std::size_t{0}; i < bytes.size(); i += 3) {
    auto remaining = std::min<std::size_t>(3, bytes.size() - i);
    auto group = uint32_t{0};
    for (auto j = std::size_t{0}; j < 3; ++j) {
      group <<= 8u;
      if (j < remaining) {
        group |= bytes[i + j];
      }
    }
    for (auto j = std::size_t{0}; j < 4; ++j) {
      if (j <= remaining) {
        out.push_back(kBase64Alphabet[(group >> (18u - (6u * j))) & 0x3Fu]);
      } else {
        out.push_back('=');
      }
    }
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char c) {
                 return std::isspace(static_cast<unsigned char>(c)) == 0;
               });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (auto i = std::size_t{0}; i < compact.size(); i += 4) {
    auto last = (i + 4) == compact.size();
    auto group = uint32_t{0};
    auto padding = std::size_t{0};
    for (auto j = std::size_t{0}; j < 4; ++j) {
      auto c = compact[i + j];
      group <<= 6u;
      if (c == '=') {
        // Padding is only legal in the final two positions of the last group.
        if (!last || j < 2) {
          return std::nullopt;
        }
        ++padding;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      auto value = base64_value(c);
      if (!value) {
        return std::nullopt;
      }
      group |= *value;
    }
    for (auto j = std::size_t{0}; j < 3 - padding; ++j) {
      out.push_back(static_cast<uint8_t>((group >> (16u - (8u * j))) & 0xFFu));
    }
  }
  return out;
}

std::optional<amount_t> try_make_amount(const std::string_view text) {
  if (text.empty() ||
      !std::all_of(std::begin(text), std::end(text), [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return std::nullopt;
  }
  auto value = boost::multiprecision::cpp_int{std::string{text}};
  if (value > std::numeric_limits<amount_t>::max()) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

}  // namespace agora::schema
