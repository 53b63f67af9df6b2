#include <gtest/gtest.h>
#include <icnp/canonical/canonicalize.hpp>

#include <limits>
#include <string>

namespace {

std::string canonical_text(const icnp::schema::json_t& document) {
  auto error = std::string{};
  auto bytes = icnp::canonical::canonicalize(document, error);
  EXPECT_TRUE(bytes.has_value()) << error;
  if (!bytes) {
    return {};
  }
  return std::string{icnp::schema::make_string_view(*bytes)};
}

}  // namespace

TEST(canonicalize, sorts_members_at_every_depth) {
  auto document = icnp::schema::json_t::object();
  document["zeta"] = 1;
  document["alpha"] = icnp::schema::json_t{{"y", true}, {"b", nullptr}};
  document["mid"] = icnp::schema::json_t::array({3, "x"});
  EXPECT_EQ(canonical_text(document),
            R"({"alpha":{"b":null,"y":true},"mid":[3,"x"],"zeta":1})");
}

TEST(canonicalize, member_order_does_not_change_bytes) {
  auto first = icnp::schema::json_t::object();
  first["a"] = 1;
  first["b"] = "two";
  auto second = icnp::schema::json_t::object();
  second["b"] = "two";
  second["a"] = 1;
  EXPECT_EQ(canonical_text(first), canonical_text(second));
}

TEST(canonicalize, keeps_array_order_and_non_ascii_text) {
  auto document = icnp::schema::json_t::array({"b", "a", "\xC3\xA9t\xC3\xA9"});
  EXPECT_EQ(canonical_text(document), "[\"b\",\"a\",\"\xC3\xA9t\xC3\xA9\"]");
}

TEST(canonicalize, refuses_non_finite_numbers) {
  auto document = icnp::schema::json_t::object();
  document["value"] = std::numeric_limits<double>::quiet_NaN();
  auto error = std::string{};
  EXPECT_FALSE(icnp::canonical::canonicalize(document, error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(canonicalize, refuses_invalid_utf8) {
  auto document = icnp::schema::json_t::object();
  document["value"] = std::string{"\xFF\xFE"};
  auto error = std::string{};
  EXPECT_FALSE(icnp::canonical::canonicalize(document, error).has_value());
}

TEST(canonicalize, default_canonicalizer_matches_function) {
  auto canonicalizer = icnp::canonical::make_default_canonicalizer();
  auto document = icnp::schema::json_t{{"k", 1.5}};
  auto bytes = canonicalizer(document);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(icnp::schema::make_string_view(*bytes), R"({"k":1.5})");
}
