#include <catch2/catch.hpp>

#include "core/link/LinkCodec.hpp"

#include <optional>
#include <string>

using namespace sgw;

TEST_CASE("LinkCodec reads hash and id from a combined path", "[link_codec]") {
  auto ref = parse_link("AbC-_9123", std::nullopt);
  REQUIRE(ref.ok());
  REQUIRE(ref->capability_hash == "AbC-_9");
  REQUIRE(ref->object_id == 123);
}

TEST_CASE("LinkCodec reads id from path and hash from query", "[link_codec]") {
  auto ref = parse_link("4821/Some%20Movie.mkv", std::string("x1Y2z3"));
  REQUIRE(ref.ok());
  REQUIRE(ref->object_id == 4821);
  REQUIRE(ref->capability_hash == "x1Y2z3");

  auto bare = parse_link("77", std::string("abcdef"));
  REQUIRE(bare.ok());
  REQUIRE(bare->object_id == 77);
}

TEST_CASE("LinkCodec rejects paths without an id", "[link_codec]") {
  for (const char* p : {"movie.mkv", "abcdef", "", "/123", "12ab?x"}) {
    auto ref = parse_link(p, std::string("abcdef"));
    INFO(p);
    REQUIRE_FALSE(ref.ok());
    REQUIRE(ref.error().kind == ErrorKind::MalformedRequest);
  }
}

TEST_CASE("LinkCodec requires a hash for id-only paths", "[link_codec]") {
  auto missing = parse_link("123/file.bin", std::nullopt);
  REQUIRE_FALSE(missing.ok());
  REQUIRE(missing.error().kind == ErrorKind::MalformedRequest);

  auto empty = parse_link("123/file.bin", std::string());
  REQUIRE_FALSE(empty.ok());
  REQUIRE(empty.error().kind == ErrorKind::MalformedRequest);
}

TEST_CASE("LinkCodec empty query hash falls back to the path hash", "[link_codec]") {
  auto ref = parse_link("qwerty42", std::string());
  REQUIRE(ref.ok());
  REQUIRE(ref->capability_hash == "qwerty");
  REQUIRE(ref->object_id == 42);
}

TEST_CASE("LinkCodec hash precedence when path and query disagree", "[link_codec]") {
  SECTION("query wins by default") {
    auto ref = parse_link("qwerty42", std::string("zzzzzz"));
    REQUIRE(ref.ok());
    REQUIRE(ref->capability_hash == "zzzzzz");
    REQUIRE(ref->object_id == 42);
  }
  SECTION("path wins when configured") {
    auto ref = parse_link("qwerty42", std::string("zzzzzz"), HashPrecedence::Path);
    REQUIRE(ref.ok());
    REQUIRE(ref->capability_hash == "qwerty");
  }
  SECTION("strict rejects the conflict") {
    auto ref = parse_link("qwerty42", std::string("zzzzzz"), HashPrecedence::Strict);
    REQUIRE_FALSE(ref.ok());
    REQUIRE(ref.error().kind == ErrorKind::MalformedRequest);
  }
  SECTION("strict accepts agreeing hashes") {
    auto ref = parse_link("qwerty42", std::string("qwerty"), HashPrecedence::Strict);
    REQUIRE(ref.ok());
    REQUIRE(ref->capability_hash == "qwerty");
  }
}

TEST_CASE("LinkCodec treats long all-digit paths as token plus id", "[link_codec]") {
  // "1234567" matches <6-char token><digits>; the query hash still wins.
  auto ref = parse_link("1234567", std::string("abcdef"));
  REQUIRE(ref.ok());
  REQUIRE(ref->object_id == 7);
  REQUIRE(ref->capability_hash == "abcdef");

  // A short numeric path is just an id.
  auto shortid = parse_link("123456", std::string("abcdef"));
  REQUIRE(shortid.ok());
  REQUIRE(shortid->object_id == 123456);
}

TEST_CASE("LinkCodec rejects ids that overflow", "[link_codec]") {
  auto a = parse_link("99999999999999999999999/x", std::string("abcdef"));
  REQUIRE_FALSE(a.ok());
  auto b = parse_link("abcdef99999999999999999999", std::nullopt);
  REQUIRE_FALSE(b.ok());
  REQUIRE(b.error().kind == ErrorKind::MalformedRequest);
}

TEST_CASE("LinkCodec hash precedence names round-trip", "[link_codec]") {
  REQUIRE(parse_hash_precedence("query") == HashPrecedence::Query);
  REQUIRE(parse_hash_precedence("path") == HashPrecedence::Path);
  REQUIRE(parse_hash_precedence("strict") == HashPrecedence::Strict);
  REQUIRE_FALSE(parse_hash_precedence("QUERY").has_value());
  REQUIRE(std::string(hash_precedence_name(HashPrecedence::Strict)) == "strict");
}

TEST_CASE("LinkCodec builds watch and download links", "[link_codec]") {
  REQUIRE(quote_plus("My Movie (2020).mkv") == "My+Movie+%282020%29.mkv");
  REQUIRE(quote_plus("a/b&c") == "a%2Fb%26c");

  const std::string base = "https://files.example.org/";
  REQUIRE(make_watch_link(base, 15, "clip one.mp4", "Ab_-9z") ==
          "https://files.example.org/watch/15/clip+one.mp4?hash=Ab_-9z");
  REQUIRE(make_download_link(base, 15, "clip one.mp4", "Ab_-9z") ==
          "https://files.example.org/15/clip+one.mp4?hash=Ab_-9z");

  // The generated download path parses back to the same id and hash.
  auto ref = parse_link("15/clip+one.mp4", std::string("Ab_-9z"));
  REQUIRE(ref.ok());
  REQUIRE(ref->object_id == 15);
}
