#include <icnp/schema/encoding/json/actor.hpp>
#include <icnp/schema/encoding/json/primitives.hpp>

namespace icnp::schema {

void to_json(json_t& j, const actor_role_t& o) {
  j = std::string{to_string(o)};
}

void from_json(const json_t& j, actor_role_t& o) {
  o = encoding::json::enum_from_json<actor_role_t>(j);
}

void to_json(json_t& j, const actor_t& o) {
  j = json_t::object();
  j["id"] = o.id;
  j["role"] = o.role;
  encoding::json::write_optional(j, "display_name", o.display_name);
}

void from_json(const json_t& j, actor_t& o) {
  o.id = encoding::json::require_string(j, "id");
  o.role = encoding::json::require(j, "role").get<actor_role_t>();
  encoding::json::read_optional(j, "display_name", o.display_name);
}

}  // namespace icnp::schema
