#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/upstream/SessionClient.hpp"

namespace sgw {

// One authenticated upstream connection and its in-flight request count.
class Session {
public:
  Session(int64_t id, std::shared_ptr<SessionClient> client)
    : id_(id), client_(std::move(client)) {}

  int64_t id() const { return id_; }
  const std::shared_ptr<SessionClient>& client() const { return client_; }
  int64_t workload() const { return workload_.load(std::memory_order_acquire); }

private:
  friend class SessionPool;

  int64_t                        id_;
  std::shared_ptr<SessionClient> client_;
  std::atomic<int64_t>           workload_{0};
};

// Fixed set of sessions, balanced by least workload. Owned by the server and
// passed to request handlers; lives for the whole process.
class SessionPool {
public:
  // Holds one unit of a session's workload until destroyed.
  class Lease {
  public:
    Lease() = default;
    explicit Lease(Session* s) : session_(s) {}
    ~Lease() { release(); }

    Lease(Lease&& o) noexcept : session_(o.session_) { o.session_ = nullptr; }
    Lease& operator=(Lease&& o) noexcept {
      if (this != &o) { release(); session_ = o.session_; o.session_ = nullptr; }
      return *this;
    }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Session* session() const { return session_; }
    explicit operator bool() const { return session_ != nullptr; }
    void release();

  private:
    Session* session_ = nullptr;
  };

  // Session ids are assigned 0..n-1 in the order given.
  explicit SessionPool(std::vector<std::shared_ptr<SessionClient>> clients);

  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

  // Least-loaded session; ties go to the earliest in pool order. Does not
  // change any counter.
  Session& select_session();

  // select_session() plus an atomic increment, undone when the lease ends.
  Lease acquire();

  // Counts work placed on a specific session.
  Lease lease(Session& s);

  int64_t workload(const Session& s) const { return s.workload(); }
  size_t size() const { return sessions_.size(); }
  const std::vector<std::unique_ptr<Session>>& sessions() const { return sessions_; }

private:
  static void adjust(Session& s, int64_t delta);

  std::vector<std::unique_ptr<Session>> sessions_;
};

} // namespace sgw
