#include <icnp/common/time.hpp>

#include <chrono>
#include <cstdint>

#include <fmt/format.h>

namespace icnp::common {

namespace {

std::optional<int> parse_digits(const std::string_view value,
                                const std::size_t offset,
                                const std::size_t count) {
  if (offset + count > value.size()) {
    return std::nullopt;
  }
  auto result = 0;
  for (auto i = offset; i < offset + count; ++i) {
    const auto c = value[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    result = result * 10 + (c - '0');
  }
  return result;
}

bool expect(const std::string_view value,
            const std::size_t offset,
            const char c) {
  return offset < value.size() && value[offset] == c;
}

}  // namespace

schema::timestamp_milliseconds_t now_milliseconds() {
  return static_cast<schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::string format_rfc3339(const schema::timestamp_milliseconds_t value) {
  const auto instant = std::chrono::sys_time<std::chrono::milliseconds>{
      std::chrono::milliseconds{static_cast<int64_t>(value)}};
  const auto day = std::chrono::floor<std::chrono::days>(instant);
  const auto date = std::chrono::year_month_day{day};
  const auto time = std::chrono::hh_mm_ss{instant - day};
  const auto millis = time.subseconds().count();

  auto result = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                            static_cast<int>(date.year()),
                            static_cast<unsigned>(date.month()),
                            static_cast<unsigned>(date.day()),
                            time.hours().count(), time.minutes().count(),
                            time.seconds().count());
  if (millis != 0) {
    result += fmt::format(".{:03}", millis);
  }
  result.push_back('Z');
  return result;
}

std::optional<schema::timestamp_milliseconds_t> parse_rfc3339(
    const std::string_view value) {
  const auto year = parse_digits(value, 0, 4);
  const auto month = parse_digits(value, 5, 2);
  const auto day = parse_digits(value, 8, 2);
  const auto hour = parse_digits(value, 11, 2);
  const auto minute = parse_digits(value, 14, 2);
  const auto second = parse_digits(value, 17, 2);
  if (!year || !month || !day || !hour || !minute || !second) {
    return std::nullopt;
  }
  if (!expect(value, 4, '-') || !expect(value, 7, '-') ||
      !(expect(value, 10, 'T') || expect(value, 10, 't')) ||
      !expect(value, 13, ':') || !expect(value, 16, ':')) {
    return std::nullopt;
  }
  if (*hour > 23 || *minute > 59 || *second > 60) {
    return std::nullopt;
  }

  const auto date = std::chrono::year{*year} /
                    std::chrono::month{static_cast<unsigned>(*month)} /
                    std::chrono::day{static_cast<unsigned>(*day)};
  if (!date.ok()) {
    return std::nullopt;
  }

  auto offset = std::size_t{19};
  auto millis = int64_t{0};
  if (expect(value, offset, '.')) {
    ++offset;
    auto digits = 0;
    while (offset < value.size() && value[offset] >= '0' &&
           value[offset] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (value[offset] - '0');
      }
      ++digits;
      ++offset;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }

  auto zone_minutes = int64_t{0};
  if (expect(value, offset, 'Z') || expect(value, offset, 'z')) {
    ++offset;
  } else if (expect(value, offset, '+') || expect(value, offset, '-')) {
    const auto sign = value[offset] == '-' ? -1 : 1;
    const auto zone_hour = parse_digits(value, offset + 1, 2);
    const auto zone_minute = parse_digits(value, offset + 4, 2);
    if (!zone_hour || !zone_minute || !expect(value, offset + 3, ':') ||
        *zone_hour > 23 || *zone_minute > 59) {
      return std::nullopt;
    }
    zone_minutes = sign * (*zone_hour * 60 + *zone_minute);
    offset += 6;
  } else {
    return std::nullopt;
  }
  if (offset != value.size()) {
    return std::nullopt;
  }

  const auto days = std::chrono::sys_days{date}.time_since_epoch().count();
  const auto total =
      ((static_cast<int64_t>(days) * 24 + *hour) * 60 + *minute -
       zone_minutes) * 60'000 +
      static_cast<int64_t>(*second) * 1'000 + millis;
  if (total < 0) {
    return std::nullopt;
  }
  return static_cast<schema::timestamp_milliseconds_t>(total);
}

}  // namespace icnp::common
