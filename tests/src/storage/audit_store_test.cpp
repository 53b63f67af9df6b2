#include <gtest/gtest.h>
#include <icnp/audit/audit_log.hpp>
#include <icnp/storage/audit_store.hpp>
#include <icnp/testing/common.hpp>

#include <limits>
#include <memory>

using namespace icnp::schema;

namespace {

audit_event_t make_event(const uint64_t sequence,
                         const audit_event_kind_t kind) {
  auto event = icnp::audit::make_audit_event(
      kind, "session-1", {"agent-a"}, icnp::testing::kStartTime + sequence,
      json_t{{"zeta", 1}, {"alpha", "x"}});
  event.sequence = sequence;
  return event;
}

}  // namespace

TEST(audit_store, keys_are_prefixed_big_endian_sequences) {
  auto key = icnp::storage::make_audit_key(0x0102030405060708ULL);
  EXPECT_EQ(icnp::schema::make_string(key), std::string("AUD|\x01\x02\x03\x04\x05\x06\x07\x08", 12));
  EXPECT_EQ(icnp::storage::parse_audit_key(key), 0x0102030405060708ULL);
  EXPECT_LT(icnp::storage::make_audit_key(255),
            icnp::storage::make_audit_key(256));

  auto foreign = icnp::schema::make_bytes(std::string_view{"XYZ|12345678"});
  EXPECT_FALSE(icnp::storage::parse_audit_key(foreign).has_value());
  auto short_key = icnp::schema::make_bytes(std::string_view{"AUD|1"});
  EXPECT_FALSE(icnp::storage::parse_audit_key(short_key).has_value());
}

TEST(audit_store, stores_and_loads_events_once) {
  auto path = icnp::testing::make_db_path("icnp_audit_store");
  {
    auto storage =
        icnp::storage::make_storage<icnp::storage::rocksdb_storage_tag>(path);
    EXPECT_TRUE(icnp::storage::store_audit_event(
        storage, make_event(1, audit_event_kind_t::session_created)));
    EXPECT_FALSE(icnp::storage::store_audit_event(
        storage, make_event(1, audit_event_kind_t::violation)));

    auto loaded = icnp::storage::load_audit_event(storage, 1);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->kind, audit_event_kind_t::session_created);
    EXPECT_EQ(loaded->timestamp, icnp::testing::kStartTime + 1);
    EXPECT_EQ(loaded->subject_ids, (std::vector<std::string>{"agent-a"}));
    EXPECT_EQ(loaded->details["alpha"], "x");
    EXPECT_FALSE(icnp::storage::load_audit_event(storage, 2).has_value());
  }
  icnp::testing::remove_path(path);
}

TEST(audit_store, range_reads_follow_sequence_order) {
  auto path = icnp::testing::make_db_path("icnp_audit_range");
  {
    auto storage =
        icnp::storage::make_storage<icnp::storage::rocksdb_storage_tag>(path);
    for (const auto sequence : {uint64_t{3}, uint64_t{1}, uint64_t{256},
                                uint64_t{2}}) {
      ASSERT_TRUE(icnp::storage::store_audit_event(
          storage, make_event(sequence, audit_event_kind_t::peer_audit)));
    }
    auto events = icnp::storage::load_audit_events(storage, 1, 257);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].sequence, 1u);
    EXPECT_EQ(events[1].sequence, 2u);
    EXPECT_EQ(events[2].sequence, 3u);
    EXPECT_EQ(events[3].sequence, 256u);

    EXPECT_EQ(icnp::storage::load_audit_events(storage, 2, 4).size(), 2u);
    EXPECT_TRUE(icnp::storage::load_audit_events(storage, 5, 5).empty());
  }
  icnp::testing::remove_path(path);
}

TEST(audit_store, sink_persists_everything_the_log_appends) {
  auto path = icnp::testing::make_db_path("icnp_audit_sink");
  {
    auto storage = std::make_shared<icnp::storage::audit_storage_t>(
        icnp::storage::make_storage<icnp::storage::rocksdb_storage_tag>(path));
    auto audit = icnp::audit::audit_log{icnp::storage::make_audit_sink(storage)};
    audit.append(icnp::audit::make_audit_event(
        audit_event_kind_t::session_created, "s-1", {}, 1));
    audit.append(icnp::audit::make_audit_event(
        audit_event_kind_t::phase_changed, "s-1", {}, 2,
        json_t{{"from", "intent"}, {"to", "capability"}}));
    EXPECT_EQ(audit.sink_failures(), 0u);

    auto stored = icnp::storage::load_audit_events(
        *storage, 1, std::numeric_limits<uint64_t>::max());
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[1].kind, audit_event_kind_t::phase_changed);
    EXPECT_EQ(stored[1].details["to"], "capability");
  }
  icnp::testing::remove_path(path);
}
