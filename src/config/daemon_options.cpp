#include <icnp/config/daemon_options.hpp>
#include <icnp/execution/signers.hpp>
#include <icnp/schema/actor.hpp>

#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <sstream>

using namespace icnp::schema;

namespace po = boost::program_options;

namespace {

constexpr auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

constexpr auto kSignerNone = std::string_view{"none"};

}  // namespace

namespace icnp::config {

parse_outcome_t parse_daemon_options(const int argc,
                                     const char* const argv[],
                                     daemon_options_t& out,
                                     std::string& message) {
  auto config_file = std::string{};
  auto role = std::string{to_string(out.engine.identity.role)};
  auto max_total = out.engine.default_max_invocations_total.value_or(0);

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the settings below");

  auto settings = po::options_description{"Engine"};
  settings.add_options()(
      "identity-id",
      po::value<std::string>(&out.engine.identity.id)
          ->default_value(out.engine.identity.id),
      "Actor id this engine signs and replies as")(
      "identity-role", po::value<std::string>(&role)->default_value(role),
      "Actor role of this engine")(
      "negotiation-ttl-ms",
      po::value<duration_milliseconds_t>(&out.engine.negotiation_ttl_ms)
          ->default_value(out.engine.negotiation_ttl_ms),
      "Lifetime of a session that has not reached the token phase")(
      "token-ttl-ms",
      po::value<duration_milliseconds_t>(&out.engine.token_ttl_ms)
          ->default_value(out.engine.token_ttl_ms),
      "Validity window of issued execution tokens")(
      "max-invocations-per-actor",
      po::value<uint32_t>(&out.engine.default_max_invocations_per_actor)
          ->default_value(out.engine.default_max_invocations_per_actor),
      "Default per-actor invocation limit")(
      "max-invocations-total",
      po::value<uint32_t>(&max_total)->default_value(max_total),
      "Default shared invocation limit, 0 for none")(
      "binding-hash",
      po::value<std::string>(&out.engine.binding_hash_algorithm)
          ->default_value(out.engine.binding_hash_algorithm),
      "Token binding hash: sha256 or blake3")(
      "collaborator-timeout-ms",
      po::value<duration_milliseconds_t>(&out.engine.collaborator_timeout_ms)
          ->default_value(out.engine.collaborator_timeout_ms),
      "Deadline for signer, canonicalizer and rollback calls, 0 runs inline")(
      "collaborator-threads",
      po::value<uint32_t>(&out.engine.collaborator_threads)
          ->default_value(out.engine.collaborator_threads),
      "Threads running collaborator calls that have a deadline")(
      "require-full-coverage",
      po::bool_switch(&out.engine.require_full_coverage),
      "Contracts must cover every requested intent action")(
      "auto-issue-token", po::bool_switch(&out.engine.auto_issue_token),
      "Issue the execution token as soon as a contract is accepted")(
      "signing-key-id",
      po::value<std::string>(&out.engine.signing_key_id)
          ->default_value(out.engine.signing_key_id),
      "Key id carried in produced signatures")(
      "signer", po::value<std::string>(&out.signer)->default_value(out.signer),
      "Signing scheme: hmac-sha256, ed25519 or none")(
      "signing-key", po::value<std::string>(&out.signing_key_hex),
      "Hex signing secret (hmac-sha256) or 32-byte seed (ed25519)");

  auto driver = po::options_description{"Driver"};
  driver.add_options()(
      "input,i", po::value<std::string>(&out.input)->default_value(out.input),
      "NDJSON envelope file, - for stdin")(
      "audit-db", po::value<std::string>(&out.audit_db),
      "RocksDB directory for durable audit events")(
      "dump-audit", po::bool_switch(&out.dump_audit),
      "Write the audit log as NDJSON after the input is drained")(
      "log-level",
      po::value<std::string>(&out.log_level)->default_value(out.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&out.log_file)->default_value(out.log_file),
      "Log file path");

  auto file_options = po::options_description{};
  file_options.add(settings).add(driver);
  auto command_line = po::options_description{"icnpd"};
  command_line.add(generic).add(settings).add(driver);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, command_line), vm);
    if (vm.contains("help")) {
      auto usage = std::ostringstream{};
      usage << command_line;
      message = usage.str();
      return parse_outcome_t::help;
    }
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), file_options),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    message = e.what();
    return parse_outcome_t::error;
  }

  auto parsed_role = try_from_string<actor_role_t>(role);
  if (!parsed_role) {
    message = "unknown identity role '" + role + "' (expected one of " +
              names_of(kActorRoleMappings) + ")";
    return parse_outcome_t::error;
  }
  out.engine.identity.role = *parsed_role;
  out.engine.default_max_invocations_total =
      max_total == 0 ? std::nullopt : std::optional<uint32_t>{max_total};

  if (!validate(out, message)) {
    return parse_outcome_t::error;
  }
  return parse_outcome_t::run;
}

bool validate(const daemon_options_t& options, std::string& error) {
  if (!validate(options.engine, error)) {
    return false;
  }
  if (std::ranges::find(kLogLevels, options.log_level) == kLogLevels.end()) {
    error = "unknown log level '" + options.log_level + "'";
    return false;
  }
  if (options.signer == kSignerNone) {
    return true;
  }
  if (options.signer != icnp::execution::kHmacSha256Algorithm &&
      options.signer != icnp::execution::kEd25519Algorithm) {
    error = "unknown signer '" + options.signer + "'";
    return false;
  }
  auto key = try_from_hex(options.signing_key_hex);
  if (!key || key->empty()) {
    error = "signing key must be non-empty hex";
    return false;
  }
  if (options.signer == icnp::execution::kEd25519Algorithm &&
      key->size() != 32) {
    error = "ed25519 signing key must be a 32-byte seed";
    return false;
  }
  return true;
}

}  // namespace icnp::config
