#include <catch2/catch.hpp>

#include "FakeSessionClient.hpp"
#include "core/session/SessionPool.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sgw;
using sgw::testing::FakeSessionClient;

static std::vector<std::shared_ptr<SessionClient>> make_clients(size_t n) {
  std::vector<std::shared_ptr<SessionClient>> out;
  for (size_t i = 0; i < n; ++i) out.push_back(std::make_shared<FakeSessionClient>());
  return out;
}

TEST_CASE("SessionPool assigns ids in order", "[session_pool]") {
  SessionPool pool(make_clients(3));
  REQUIRE(pool.size() == 3);
  for (size_t i = 0; i < pool.size(); ++i) {
    REQUIRE(pool.sessions()[i]->id() == static_cast<int64_t>(i));
    REQUIRE(pool.sessions()[i]->workload() == 0);
  }
}

TEST_CASE("SessionPool rejects an empty client list", "[session_pool]") {
  REQUIRE_THROWS_AS(SessionPool(make_clients(0)), std::invalid_argument);
}

TEST_CASE("SessionPool picks the least loaded session", "[session_pool]") {
  SessionPool pool(make_clients(3));
  Session& a = *pool.sessions()[0];
  Session& b = *pool.sessions()[1];
  Session& c = *pool.sessions()[2];

  std::vector<SessionPool::Lease> held;
  for (int i = 0; i < 3; ++i) held.push_back(pool.lease(a));
  held.push_back(pool.lease(b));
  held.push_back(pool.lease(c));

  // {3, 1, 1}: tie between b and c goes to the earlier one
  REQUIRE(&pool.select_session() == &b);
  REQUIRE(pool.workload(b) == 1);

  auto next = pool.acquire();
  REQUIRE(next.session() == &b);
  REQUIRE(pool.workload(b) == 2);
  REQUIRE(&pool.select_session() == &c);
}

TEST_CASE("SessionPool selection does not change counters", "[session_pool]") {
  SessionPool pool(make_clients(2));
  pool.select_session();
  pool.select_session();
  REQUIRE(pool.sessions()[0]->workload() == 0);
  REQUIRE(pool.sessions()[1]->workload() == 0);
}

TEST_CASE("SessionPool leases release their workload", "[session_pool]") {
  SessionPool pool(make_clients(2));
  Session* s = nullptr;
  {
    auto lease = pool.acquire();
    REQUIRE(lease);
    s = lease.session();
    REQUIRE(s->workload() == 1);

    SessionPool::Lease moved = std::move(lease);
    REQUIRE_FALSE(lease);
    REQUIRE(s->workload() == 1);

    moved.release();
    REQUIRE(s->workload() == 0);
    moved.release();
    REQUIRE(s->workload() == 0);

    auto again = pool.lease(*s);
    REQUIRE(s->workload() == 1);
  }
  REQUIRE(s->workload() == 0);
}

TEST_CASE("SessionPool counters return to zero under concurrency", "[session_pool]") {
  SessionPool pool(make_clients(4));
  std::atomic<int> bad{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&pool, &bad] {
      for (int i = 0; i < 2000; ++i) {
        auto lease = pool.acquire();
        if (lease.session()->workload() < 1) bad.fetch_add(1);
      }
    });
  }
  for (auto& w : workers) w.join();

  REQUIRE(bad.load() == 0);

  for (const auto& s : pool.sessions()) REQUIRE(s->workload() == 0);
}
