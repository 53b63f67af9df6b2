#include <icnp/common/uuid.hpp>

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace icnp::common {

std::string make_uuid() {
  static thread_local auto rng = std::mt19937_64{std::random_device{}()};

  auto id = std::array<uint8_t, 16>{};
  for (auto& byte : id) {
    byte = static_cast<uint8_t>(rng());
  }

  // RFC4122 variant, version 4.
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);

  static constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto result = std::string{};
  result.reserve(36);
  for (auto i = std::size_t{0}; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      result.push_back('-');
    }
    result.push_back(kDigits[id[i] >> 4]);
    result.push_back(kDigits[id[i] & 0x0F]);
  }
  return result;
}

bool is_uuid(const std::string_view value) {
  if (value.size() != 36) {
    return false;
  }
  for (auto i = std::size_t{0}; i < value.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (value[i] != '-') {
        return false;
      }
      continue;
    }
    if (std::isxdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace icnp::common
