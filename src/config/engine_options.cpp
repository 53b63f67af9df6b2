#include <icnp/config/engine_options.hpp>

namespace icnp::config {

bool validate(const engine_options_t& options, std::string& error) {
  if (options.identity.id.empty()) {
    error = "identity id must not be empty";
    return false;
  }
  if (options.negotiation_ttl_ms == 0) {
    error = "negotiation TTL must be positive";
    return false;
  }
  if (options.token_ttl_ms == 0) {
    error = "token TTL must be positive";
    return false;
  }
  if (options.default_max_invocations_per_actor == 0) {
    error = "per-actor invocation limit must be positive";
    return false;
  }
  if (options.default_max_invocations_total &&
      *options.default_max_invocations_total == 0) {
    error = "total invocation limit must be positive when set";
    return false;
  }
  if (options.collaborator_timeout_ms != 0 &&
      options.collaborator_threads == 0) {
    error = "collaborator threads must be positive when calls have a deadline";
    return false;
  }
  if (options.binding_hash_algorithm != kSha256 &&
      options.binding_hash_algorithm != kBlake3) {
    error = "unknown binding hash algorithm '" +
            options.binding_hash_algorithm + "'";
    return false;
  }
  if (options.signing_key_id.empty()) {
    error = "signing key id must not be empty";
    return false;
  }
  if (options.icnp_version.empty()) {
    error = "protocol version must not be empty";
    return false;
  }
  return true;
}

}  // namespace icnp::config
