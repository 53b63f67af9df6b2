#pragma once

#include <icnp/config/engine_options.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/execution/signers.hpp>
#include <icnp/schema/actor.hpp>
#include <icnp/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace icnp::testing {

// 2023-11-14T22:13:20Z
inline constexpr auto kStartTime =
    icnp::schema::timestamp_milliseconds_t{1'700'000'000'000};
inline constexpr auto kSigningKeyId = std::string_view{"test-key"};

class manual_clock final {
 public:
  explicit manual_clock(
      const icnp::schema::timestamp_milliseconds_t start = kStartTime)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  icnp::schema::timestamp_milliseconds_t now() const { return now_->load(); }

  void advance(const icnp::schema::duration_milliseconds_t by) {
    now_->fetch_add(by);
  }

  icnp::execution::time_source_t source() const {
    auto now = now_;
    return [now] { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

/// Invocation ids handed to the rollback executor.
struct rollback_log_t final {
  std::mutex mutex;
  std::vector<std::string> invocation_ids;
};

inline icnp::schema::bytes_t make_hmac_key() {
  return icnp::schema::make_bytes(
      std::string_view{"icnp-test-secret-0123456789abcdef"});
}

inline icnp::execution::token_signer_t make_test_signer() {
  return icnp::execution::make_hmac_sha256_signer(
      {{std::string{kSigningKeyId}, make_hmac_key()}});
}

inline icnp::config::engine_options_t make_test_options() {
  auto options = icnp::config::engine_options_t{};
  options.collaborator_timeout_ms = 0;
  options.signing_key_id = std::string{kSigningKeyId};
  return options;
}

inline icnp::execution::collaborators_t make_test_collaborators(
    const manual_clock& clock,
    std::shared_ptr<rollback_log_t> rollbacks = nullptr,
    const icnp::execution::rollback_status_t rollback_status =
        icnp::execution::rollback_status_t::ok) {
  auto collaborators = icnp::execution::make_default_collaborators();
  collaborators.signer = make_test_signer();
  collaborators.clock = clock.source();
  if (rollbacks) {
    collaborators.rollback = [rollbacks,
                              rollback_status](const std::string& id) {
      auto lock = std::scoped_lock{rollbacks->mutex};
      rollbacks->invocation_ids.push_back(id);
      return rollback_status;
    };
  }
  return collaborators;
}

inline icnp::schema::actor_t make_initiator() {
  return icnp::schema::actor_t{
      .id = "orchestrator-1",
      .role = icnp::schema::actor_role_t::orchestrator,
      .display_name = std::nullopt};
}

inline icnp::schema::actor_t make_agent(const std::string& id) {
  return icnp::schema::actor_t{.id = id,
                               .role = icnp::schema::actor_role_t::agent,
                               .display_name = std::nullopt};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace icnp::testing
