#include <catch2/catch.hpp>

#include "FakeSessionClient.hpp"
#include "core/stream/ByteStreamer.hpp"
#include "core/stream/ChunkPlan.hpp"
#include "core/stream/ChunkSequencer.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace sgw;
using sgw::testing::FakeSessionClient;
using sgw::testing::make_payload;

namespace {

struct Fixture {
  std::shared_ptr<FakeSessionClient> client = std::make_shared<FakeSessionClient>();
  std::shared_ptr<ByteStreamer>      streamer = std::make_shared<ByteStreamer>(0, client);
  std::string                        payload;

  explicit Fixture(size_t size) : payload(make_payload(size)) {
    client->add(1, "hashhashhash", payload);
  }

  ObjectProperties props() { return client->fetch_properties(1).value(); }

  // Pulls until the sequence ends; returns everything emitted.
  std::string drain(ChunkSequencer& seq) {
    std::string all, part;
    for (;;) {
      auto more = seq.next(part);
      REQUIRE(more.ok());
      if (!more.value()) break;
      all += part;
    }
    return all;
  }
};

} // namespace

TEST_CASE("make_chunk_plan aligns fetches to chunk boundaries", "[chunk_plan]") {
  auto plan = make_chunk_plan(RangeSpec{1500, 3100, RangeStatus::Partial}, 1024);
  REQUIRE(plan.aligned_offset == 1024);
  REQUIRE(plan.first_cut == 476);
  REQUIRE(plan.last_cut == 29);
  REQUIRE(plan.part_count == 3);
  REQUIRE(plan.offset_of(2) == 3072);

  auto exact = make_chunk_plan(RangeSpec{1024, 2047, RangeStatus::Partial}, 1024);
  REQUIRE(exact.first_cut == 0);
  REQUIRE(exact.last_cut == 1024);
  REQUIRE(exact.part_count == 1);

  auto empty = make_chunk_plan(RangeSpec{0, -1, RangeStatus::Full}, 1024);
  REQUIRE(empty.part_count == 0);

  REQUIRE_THROWS_AS(make_chunk_plan(RangeSpec{0, 10, RangeStatus::Full}, 0), std::invalid_argument);
}

TEST_CASE("ChunkSequencer emits exactly the requested slice", "[chunk_sequencer]") {
  Fixture f(4000);
  const RangeSpec range{1500, 3100, RangeStatus::Partial};
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(range, 1024));

  const std::string out = f.drain(*seq);
  REQUIRE(out.size() == 1601);
  REQUIRE(out == f.payload.substr(1500, 1601));
  REQUIRE(seq->parts_fetched() == 3);
  REQUIRE(seq->bytes_emitted() == 1601);
  REQUIRE(f.client->chunk_calls.load() == 3);
  REQUIRE(seq->finished());
}

TEST_CASE("ChunkSequencer handles a range inside one chunk", "[chunk_sequencer]") {
  Fixture f(4000);
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{1030, 1040, RangeStatus::Partial}, 1024));
  REQUIRE(f.drain(*seq) == f.payload.substr(1030, 11));
  REQUIRE(f.client->chunk_calls.load() == 1);
}

TEST_CASE("ChunkSequencer serves a whole object ending on a boundary", "[chunk_sequencer]") {
  Fixture f(2048);
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{0, 2047, RangeStatus::Full}, 1024));
  REQUIRE(f.drain(*seq) == f.payload);
  REQUIRE(f.streamer->chunks_fetched() == 2);
  REQUIRE(f.streamer->bytes_fetched() == 2048);
}

TEST_CASE("ChunkSequencer fetches nothing until pulled", "[chunk_sequencer]") {
  Fixture f(4000);
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{0, 3999, RangeStatus::Full}, 1024));
  REQUIRE(f.client->chunk_calls.load() == 0);

  std::string part;
  REQUIRE(seq->next(part).value());
  REQUIRE(f.client->chunk_calls.load() == 1);
  REQUIRE(part.size() == 1024);
}

TEST_CASE("ChunkSequencer surfaces upstream failures mid-stream", "[chunk_sequencer]") {
  Fixture f(4000);
  f.client->fail_after = 1;
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{0, 3999, RangeStatus::Full}, 1024));

  std::string part;
  REQUIRE(seq->next(part).value());
  auto second = seq->next(part);
  REQUIRE_FALSE(second.ok());
  REQUIRE(second.error().kind == ErrorKind::UpstreamFetchFailure);
  REQUIRE(seq->finished());

  // A failed sequence stays finished and fetches nothing more.
  auto after = seq->next(part);
  REQUIRE(after.ok());
  REQUIRE_FALSE(after.value());
  REQUIRE(f.client->chunk_calls.load() == 2);
}

TEST_CASE("ChunkSequencer stops after cancel", "[chunk_sequencer]") {
  Fixture f(4000);
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{0, 3999, RangeStatus::Full}, 1024));

  std::string part;
  REQUIRE(seq->next(part).value());
  seq->cancel();
  auto r = seq->next(part);
  REQUIRE_FALSE(r.ok());
  REQUIRE(r.error().kind == ErrorKind::ClientDisconnected);
  REQUIRE(part.empty());
  REQUIRE(f.client->chunk_calls.load() == 1);
}

TEST_CASE("ChunkSequencer ends quietly when upstream runs out on a boundary", "[chunk_sequencer]") {
  Fixture f(1024);
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{0, 3999, RangeStatus::Full}, 1024));
  std::string part;
  REQUIRE(seq->next(part).value());
  auto end = seq->next(part);
  REQUIRE(end.ok());
  REQUIRE_FALSE(end.value());
  REQUIRE(seq->bytes_emitted() == 1024);
}

TEST_CASE("ChunkSequencer rejects a short chunk before the last part", "[chunk_sequencer]") {
  Fixture f(1500);
  // Plan for more bytes than upstream holds.
  auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{0, 3999, RangeStatus::Full}, 1024));
  std::string part;
  REQUIRE(seq->next(part).value());
  auto short_chunk = seq->next(part);
  REQUIRE_FALSE(short_chunk.ok());
  REQUIRE(short_chunk.error().kind == ErrorKind::UpstreamFetchFailure);
}

TEST_CASE("Adjacent ranges concatenate to the combined range", "[chunk_sequencer]") {
  Fixture f(5000);
  const int64_t chunk = 700;
  auto read = [&](int64_t a, int64_t b) {
    auto seq = f.streamer->stream(f.props(), make_chunk_plan(RangeSpec{a, b, RangeStatus::Partial}, chunk));
    return f.drain(*seq);
  };

  for (int64_t split : {1, 699, 700, 701, 2100, 4998}) {
    INFO(split);
    REQUIRE(read(0, split - 1) + read(split, 4999) == f.payload);
  }
  REQUIRE(read(123, 4321) == f.payload.substr(123, 4321 - 123 + 1));
}
