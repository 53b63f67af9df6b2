#include <icnp/common/time.hpp>
#include <icnp/execution/collaborators.hpp>

#include <spdlog/spdlog.h>

namespace icnp::execution {

capability_scorer_t make_exact_match_scorer() {
  return [](const std::string_view requested_action,
            const icnp::schema::capability_action_t& offered) {
    if (offered.action != requested_action) {
      return 0.0;
    }
    return offered.confidence;
  };
}

collaborators_t make_default_collaborators() {
  auto result = collaborators_t{};
  result.canonicalizer = icnp::canonical::make_default_canonicalizer();
  result.scorer = make_exact_match_scorer();
  result.clock = [] { return icnp::common::now_milliseconds(); };
  result.rollback = [](const std::string& invocation_id) {
    spdlog::warn("No rollback executor configured; invocation '{}' not rolled back",
                 invocation_id);
    return rollback_status_t::error;
  };
  return result;
}

}  // namespace icnp::execution
