#pragma once

#include <icnp/config/engine_options.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace icnp::config {

inline constexpr auto kStdinInput = std::string_view{"-"};

/// Settings of the `icnpd` driver: engine options plus the process-level
/// concerns around it.
struct daemon_options_t final {
  engine_options_t engine;
  // hmac-sha256, ed25519 or none.
  std::string signer{"hmac-sha256"};
  // Hex secret for hmac-sha256, hex 32-byte seed for ed25519.
  std::string signing_key_hex;
  std::string input{kStdinInput};
  // Empty keeps the audit log in memory only.
  std::string audit_db;
  bool dump_audit{};
  std::string log_level{"info"};
  std::string log_file{"icnpd.log"};
};

enum class parse_outcome_t : uint8_t { run = 0, help = 1, error = 2 };

/// Read the command line and, when `--config` names one, an INI file.
/// Command line values win over file values. On `help` the usage text is
/// written to `message`; on `error` the reason is.
parse_outcome_t parse_daemon_options(int argc,
                                     const char* const argv[],
                                     daemon_options_t& out,
                                     std::string& message);

/// Checks beyond `validate(engine_options_t)`: signer name, key presence and
/// length, log level.
bool validate(const daemon_options_t& options, std::string& error);

}  // namespace icnp::config
