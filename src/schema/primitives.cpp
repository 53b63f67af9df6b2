#include <icnp/common/critical.hpp>
#include <icnp/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace icnp::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Table = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_sextet(const char c) {
  auto position = kBase64Table.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[(byte >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    icnp::common::critical("primitives", "invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  for (; (index + 3) <= bytes.size(); index += 3) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 6u) & 0x3Fu]);
    out.push_back(kBase64Table[value & 0x3Fu]);
  }

  auto remaining = bytes.size() - index;
  if (remaining == 0) {
    return out;
  }
  auto value = static_cast<uint32_t>(bytes[index]) << 16u;
  if (remaining == 2) {
    value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
  }
  out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
  out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
  out.push_back(remaining == 2 ? kBase64Table[(value >> 6u) & 0x3Fu] : '=');
  out.push_back('=');
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char ch) {
                 return std::isspace(static_cast<unsigned char>(ch)) == 0;
               });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (size_t i = 0; i < compact.size(); i += 4) {
    auto last_chunk = (i + 4) == compact.size();
    auto padding = size_t{0};
    auto value = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      auto ch = compact[i + j];
      if (ch == '=') {
        // Padding only in the final two positions of the final chunk.
        if (!last_chunk || j < 2) {
          return std::nullopt;
        }
        ++padding;
        value <<= 6u;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      auto sextet = base64_sextet(ch);
      if (!sextet) {
        return std::nullopt;
      }
      value = (value << 6u) | *sextet;
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

}  // namespace icnp::schema
