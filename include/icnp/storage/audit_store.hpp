#pragma once

#include <icnp/execution/collaborators.hpp>
#include <icnp/schema/audit_event.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

// Durable audit records: canonical JSON values under `AUD|` + big-endian
// sequence keys, so key order is sequence order.
namespace icnp::storage {

using audit_storage_t = storage<rocksdb_storage_tag>;

icnp::schema::bytes_t make_audit_key(uint64_t sequence);
std::optional<uint64_t> parse_audit_key(const icnp::schema::bytes_view_t& key);

/// Persist one event. Refuses (returns false) when its sequence is already
/// stored or the event has no canonical form.
bool store_audit_event(audit_storage_t& storage,
                       const icnp::schema::audit_event_t& event);

std::optional<icnp::schema::audit_event_t> load_audit_event(
    const audit_storage_t& storage,
    uint64_t sequence);

/// Events with `from <= sequence < to`, in sequence order.
std::vector<icnp::schema::audit_event_t> load_audit_events(
    const audit_storage_t& storage,
    uint64_t from,
    uint64_t to);

icnp::execution::audit_sink_t make_audit_sink(
    std::shared_ptr<audit_storage_t> storage);

}  // namespace icnp::storage
