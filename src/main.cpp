#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <icnp/config/daemon_options.hpp>
#include <icnp/engine/engine.hpp>
#include <icnp/execution/collaborators.hpp>
#include <icnp/execution/signers.hpp>
#include <icnp/schema/encoding/json/encoder.hpp>
#include <icnp/storage/audit_store.hpp>
#include <map>
#include <memory>
#include <string>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

icnp::execution::token_signer_t make_signer(
    const icnp::config::daemon_options_t& options) {
  if (options.signer == "none") {
    return {};
  }
  auto key = icnp::schema::from_hex(options.signing_key_hex);
  auto keys = std::map<std::string, icnp::schema::bytes_t>{
      {options.engine.signing_key_id, std::move(key)}};
  if (options.signer == icnp::execution::kEd25519Algorithm) {
    return icnp::execution::make_ed25519_signer(std::move(keys));
  }
  return icnp::execution::make_hmac_sha256_signer(std::move(keys));
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto options = icnp::config::daemon_options_t{};
  auto message = std::string{};
  switch (icnp::config::parse_daemon_options(argc, argv, options, message)) {
    case icnp::config::parse_outcome_t::help:
      std::cout << message << std::endl;
      return 0;
    case icnp::config::parse_outcome_t::error:
      std::cerr << "icnpd: " << message << std::endl;
      return 2;
    case icnp::config::parse_outcome_t::run:
      break;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  // Protocol output owns stdout; logs go to stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "icnpd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(options.log_level));

  auto collaborators = icnp::execution::make_default_collaborators();
  collaborators.signer = make_signer(options);

  auto audit_storage = std::shared_ptr<icnp::storage::audit_storage_t>{};
  if (!options.audit_db.empty()) {
    audit_storage = std::make_shared<icnp::storage::audit_storage_t>(
        icnp::storage::make_storage<icnp::storage::rocksdb_storage_tag>(
            options.audit_db));
    collaborators.audit_sink = icnp::storage::make_audit_sink(audit_storage);
    spdlog::info("Persisting audit events to {}", options.audit_db);
  }

  auto engine = icnp::engine::engine{options.engine, std::move(collaborators)};
  spdlog::info("Engine {} ready (binding {}, signer {})",
               options.engine.identity.id,
               options.engine.binding_hash_algorithm, options.signer);

  auto file = std::ifstream{};
  if (options.input != icnp::config::kStdinInput) {
    file.open(options.input);
    if (!file) {
      spdlog::error("Cannot open input {}", options.input);
      spdlog::shutdown();
      return 1;
    }
  }
  auto& input = file.is_open() ? static_cast<std::istream&>(file) : std::cin;

  auto processed = uint64_t{};
  auto rejected = uint64_t{};
  auto line = std::string{};
  while (!shutdown_requested() && std::getline(input, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    auto result = engine.process(line);
    ++processed;
    if (!result.status.ok()) {
      ++rejected;
    }
    for (const auto& response : result.responses) {
      std::cout << response.dump() << '\n';
    }
  }
  std::cout.flush();

  if (options.dump_audit) {
    auto encoder =
        icnp::schema::encoding::encoder<icnp::schema::encoding::json_encoder_tag>{};
    for (const auto& event : engine.audit().events()) {
      std::cout << encoder.to_document(event).dump() << '\n';
    }
    std::cout.flush();
  }

  spdlog::info("Processed {} envelopes, {} rejected, {} audit events",
               processed, rejected, engine.audit().size());
  if (engine.audit().sink_failures() > 0) {
    spdlog::warn("{} audit events were not persisted",
                 engine.audit().sink_failures());
  }

  spdlog::shutdown();
  return 0;
}
