#include <icnp/canonical/canonicalize.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>
#include <icnp/storage/audit_store.hpp>

#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

using namespace icnp::schema;

namespace icnp::storage {

namespace {

constexpr auto kAuditKeyPrefix = std::string_view{"AUD|"};
constexpr auto kSequenceBytes = std::size_t{8};

// Values are stored exactly as canonicalized; reads go through the JSON codec.
struct canonical_audit_codec final {
  bytes_t encode(const bytes_t& canonical) { return canonical; }

  template <typename T>
  std::optional<T> try_decode(const bytes_view_t& bytes) {
    return encoding::encoder<encoding::json_encoder_tag>{}.try_decode<T>(bytes);
  }
};

}  // namespace

bytes_t make_audit_key(const uint64_t sequence) {
  auto key = make_bytes(kAuditKeyPrefix);
  for (auto shift = 56; shift >= 0; shift -= 8) {
    key.push_back(static_cast<uint8_t>(sequence >> shift));
  }
  return key;
}

std::optional<uint64_t> parse_audit_key(const bytes_view_t& key) {
  if (key.size() != kAuditKeyPrefix.size() + kSequenceBytes ||
      make_string(key.first(kAuditKeyPrefix.size())) != kAuditKeyPrefix) {
    return std::nullopt;
  }
  auto sequence = uint64_t{0};
  for (const auto byte : key.subspan(kAuditKeyPrefix.size())) {
    sequence = (sequence << 8) | byte;
  }
  return sequence;
}

bool store_audit_event(audit_storage_t& storage, const audit_event_t& event) {
  auto encoder = encoding::encoder<encoding::json_encoder_tag>{};
  auto error = std::string{};
  auto canonical = icnp::canonical::canonicalize(encoder.to_document(event),
                                                 error);
  if (!canonical) {
    spdlog::error("Audit event #{} has no canonical form: {}", event.sequence,
                  error);
    return false;
  }
  auto codec = canonical_audit_codec{};
  const auto key = make_audit_key(event.sequence);
  return storage.put_if_absent(codec, make_bytes_view(key), *canonical);
}

std::optional<audit_event_t> load_audit_event(const audit_storage_t& storage,
                                              const uint64_t sequence) {
  auto codec = canonical_audit_codec{};
  const auto key = make_audit_key(sequence);
  return storage.get<canonical_audit_codec, audit_event_t>(
      codec, make_bytes_view(key));
}

std::vector<audit_event_t> load_audit_events(const audit_storage_t& storage,
                                             const uint64_t from,
                                             const uint64_t to) {
  auto result = std::vector<audit_event_t>{};
  if (from >= to) {
    return result;
  }
  const auto lower = make_audit_key(from);
  const auto upper = make_audit_key(to);
  auto codec = canonical_audit_codec{};
  for (const auto& [key, value] :
       storage.list_range(make_bytes_view(lower), make_bytes_view(upper))) {
    auto event = codec.try_decode<audit_event_t>(make_bytes_view(value));
    if (!event) {
      spdlog::warn("Skipping undecodable audit record {}",
                   parse_audit_key(make_bytes_view(key)).value_or(0));
      continue;
    }
    result.push_back(std::move(*event));
  }
  return result;
}

icnp::execution::audit_sink_t make_audit_sink(
    std::shared_ptr<audit_storage_t> storage) {
  return [storage = std::move(storage)](const audit_event_t& event) {
    return store_audit_event(*storage, event);
  };
}

}  // namespace icnp::storage
