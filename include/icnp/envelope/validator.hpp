#pragma once

#include <icnp/schema/envelope.hpp>
#include <icnp/schema/operation_result.hpp>
#include <icnp/schema/primitives.hpp>
#include <icnp/session/session.hpp>

#include <string>
#include <string_view>

namespace icnp::envelope {

/// Structural and causal admission of inbound envelopes.
///
/// Knows nothing about phases beyond the fixed type-to-phase pairing of the
/// envelope itself. Failures are reported with the `invalid_intent` class.
class validator final {
 public:
  /// `supported_major` is the accepted `icnp_version` major component.
  explicit validator(std::string supported_major = "1");

  /// Parse and check raw envelope text.
  icnp::schema::operation_result_t decode(
      std::string_view raw,
      icnp::schema::envelope_t& out,
      icnp::schema::json_t& document) const;

  /// Check an already parsed envelope document and decode it.
  icnp::schema::operation_result_t decode(
      const icnp::schema::json_t& document,
      icnp::schema::envelope_t& out) const;

  /// Admit `envelope` into `session`: a message id already seen is reported
  /// through `duplicate` and changes nothing; an unresolvable `in_reply_to`
  /// fails; otherwise the id is recorded as seen. A reply may name a message
  /// received in the session or one sent into it.
  icnp::schema::operation_result_t admit(
      icnp::session::session_t& session,
      const icnp::schema::envelope_t& envelope,
      bool& duplicate) const;

  /// Drop a seen message id so a redelivery is processed again.
  void forget(icnp::session::session_t& session,
              const std::string& message_id) const;

  /// Record an outbound envelope id so later replies to it resolve.
  void record_sent(icnp::session::session_t& session,
                   const std::string& message_id) const;

 private:
  std::string supported_major_;
};

}  // namespace icnp::envelope
