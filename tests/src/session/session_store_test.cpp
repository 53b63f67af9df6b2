#include <gtest/gtest.h>
#include <icnp/session/phase_machine.hpp>
#include <icnp/session/session_store.hpp>
#include <icnp/testing/common.hpp>
#include <icnp/testing/session_fixture.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace icnp::schema;

TEST(phase_machine, only_forward_steps_and_exits_are_legal) {
  EXPECT_TRUE(icnp::session::can_transition(session_phase_t::capability,
                                            session_phase_t::contract));
  EXPECT_TRUE(icnp::session::can_transition(session_phase_t::token,
                                            session_phase_t::aborted));
  EXPECT_TRUE(icnp::session::can_transition(session_phase_t::execution,
                                            session_phase_t::expired));
  EXPECT_FALSE(icnp::session::can_transition(session_phase_t::contract,
                                             session_phase_t::capability));
  EXPECT_FALSE(icnp::session::can_transition(session_phase_t::capability,
                                             session_phase_t::token));
  EXPECT_FALSE(icnp::session::can_transition(session_phase_t::intent,
                                             session_phase_t::completed));
  EXPECT_FALSE(icnp::session::can_transition(session_phase_t::expired,
                                             session_phase_t::intent));
}

TEST(session_store, open_creates_once_and_audits_creation) {
  auto audit = icnp::audit::audit_log{};
  auto store = icnp::session::session_store{audit};
  auto created = false;
  {
    auto lease = store.open("s-1", icnp::testing::make_initiator(),
                            icnp::testing::kStartTime, 1'000, created);
    EXPECT_TRUE(created);
    EXPECT_EQ(lease->phase, session_phase_t::intent);
    EXPECT_EQ(lease->negotiation_deadline, icnp::testing::kStartTime + 1'000);
    EXPECT_EQ(lease->participants.count("orchestrator-1"), 1u);
  }
  {
    auto lease = store.open("s-1", icnp::testing::make_agent("other"),
                            icnp::testing::kStartTime, 1'000, created);
    EXPECT_FALSE(created);
    EXPECT_EQ(lease->initiator.id, "orchestrator-1");
  }
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(icnp::testing::count_events(audit,
                                        audit_event_kind_t::session_created),
            1u);
  EXPECT_FALSE(store.acquire("s-2").has_value());
  EXPECT_TRUE(store.acquire("s-1").has_value());
}

TEST(session_store, transition_follows_table_and_audits) {
  auto audit = icnp::audit::audit_log{};
  auto store = icnp::session::session_store{audit};
  auto created = false;
  auto lease = store.open("s-1", icnp::testing::make_initiator(),
                          icnp::testing::kStartTime, 1'000, created);

  auto illegal = store.transition(*lease, session_phase_t::token,
                                  icnp::testing::kStartTime);
  EXPECT_EQ(illegal.code, static_cast<uint32_t>(
                              negotiation_error_code::illegal_phase_transition));
  EXPECT_EQ(lease->phase, session_phase_t::intent);

  EXPECT_TRUE(store
                  .transition(*lease, session_phase_t::capability,
                              icnp::testing::kStartTime)
                  .ok());
  EXPECT_TRUE(store
                  .transition(*lease, session_phase_t::aborted,
                              icnp::testing::kStartTime)
                  .ok());
  EXPECT_EQ(lease->phase, session_phase_t::aborted);
  EXPECT_FALSE(store
                   .transition(*lease, session_phase_t::completed,
                               icnp::testing::kStartTime)
                   .ok());

  EXPECT_EQ(icnp::testing::count_events(audit,
                                        audit_event_kind_t::phase_changed),
            2u);
  EXPECT_EQ(icnp::testing::count_events(audit,
                                        audit_event_kind_t::session_aborted),
            1u);
}

TEST(session_store, expires_only_negotiating_sessions_past_deadline) {
  auto audit = icnp::audit::audit_log{};
  auto store = icnp::session::session_store{audit};
  auto created = false;
  auto lease = store.open("s-1", icnp::testing::make_initiator(),
                          icnp::testing::kStartTime, 1'000, created);

  EXPECT_FALSE(store.expire_if_due(*lease, icnp::testing::kStartTime + 999));
  EXPECT_TRUE(store.expire_if_due(*lease, icnp::testing::kStartTime + 1'000));
  EXPECT_EQ(lease->phase, session_phase_t::expired);
  EXPECT_TRUE(store.expire_if_due(*lease, icnp::testing::kStartTime + 5'000));
  EXPECT_EQ(icnp::testing::count_events(audit,
                                        audit_event_kind_t::session_expired),
            1u);

  auto other = store.open("s-2", icnp::testing::make_initiator(),
                          icnp::testing::kStartTime, 1'000, created);
  other->phase = session_phase_t::execution;
  EXPECT_FALSE(store.expire_if_due(*other, icnp::testing::kStartTime + 5'000));
  EXPECT_EQ(other->phase, session_phase_t::execution);
}

TEST(session_store, lists_sessions_in_id_order) {
  auto audit = icnp::audit::audit_log{};
  auto store = icnp::session::session_store{audit};
  auto created = false;
  for (const auto* id : {"c", "a", "b"}) {
    store.open(id, icnp::testing::make_initiator(), icnp::testing::kStartTime,
               1'000, created);
  }
  EXPECT_EQ(store.session_ids(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(session_store, leases_serialize_access_to_one_session) {
  auto audit = icnp::audit::audit_log{};
  auto store = icnp::session::session_store{audit};
  auto created = false;
  store.open("s-1", icnp::testing::make_initiator(), icnp::testing::kStartTime,
             1'000, created);

  constexpr auto kThreads = 8;
  constexpr auto kIterations = 500;
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      for (auto i = 0; i < kIterations; ++i) {
        auto lease = store.acquire("s-1");
        ++(*lease)->invocations_per_actor["counter"];
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  auto lease = store.acquire("s-1");
  ASSERT_TRUE(lease.has_value());
  EXPECT_EQ((*lease)->invocations_per_actor["counter"],
            static_cast<uint32_t>(kThreads * kIterations));
}
