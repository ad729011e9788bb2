#include <catch2/catch.hpp>

#include "core/access/CapabilityValidator.hpp"

using namespace sgw;

static ObjectProperties props_with_hash(std::string hash) {
  ObjectProperties p;
  p.id = 9;
  p.content_hash = std::move(hash);
  p.size = 10;
  return p;
}

TEST_CASE("short_hash keeps the first six characters", "[capability]") {
  REQUIRE(short_hash("AbCdEf0123456789") == "AbCdEf");
  REQUIRE(short_hash("abc") == "abc");
}

TEST_CASE("validate_capability accepts the matching prefix", "[capability]") {
  auto p = props_with_hash("Qw_-9zRESTOFHASH");
  auto ok = validate_capability(p, "Qw_-9z");
  REQUIRE(ok.ok());
  REQUIRE(ok.value());
}

TEST_CASE("validate_capability rejects mismatches", "[capability]") {
  auto p = props_with_hash("Qw_-9zRESTOFHASH");

  SECTION("comparison is case sensitive") {
    auto r = validate_capability(p, "qw_-9z");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::InvalidCapability);
    REQUIRE(http_status_for(r.error().kind) == 403);
  }
  SECTION("wrong length") {
    REQUIRE_FALSE(validate_capability(p, "Qw_-9").ok());
    REQUIRE_FALSE(validate_capability(p, "Qw_-9zR").ok());
    REQUIRE_FALSE(validate_capability(p, "").ok());
  }
}

TEST_CASE("validate_capability never unlocks a short content hash", "[capability]") {
  auto p = props_with_hash("abc");
  auto r = validate_capability(p, "abc");
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.error().message == "Provided hash is invalid. Access Denied.");
}
