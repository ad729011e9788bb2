#include "SessionPool.hpp"

#include <stdexcept>

namespace sgw {

void SessionPool::Lease::release() {
  if (session_) {
    SessionPool::adjust(*session_, -1);
    session_ = nullptr;
  }
}

SessionPool::SessionPool(std::vector<std::shared_ptr<SessionClient>> clients) {
  if (clients.empty()) throw std::invalid_argument("session pool needs at least one session");
  sessions_.reserve(clients.size());
  int64_t id = 0;
  for (auto& c : clients) {
    sessions_.push_back(std::make_unique<Session>(id++, std::move(c)));
  }
}

Session& SessionPool::select_session() {
  Session* best = sessions_.front().get();
  int64_t best_load = best->workload();
  for (size_t i = 1; i < sessions_.size(); ++i) {
    const int64_t load = sessions_[i]->workload();
    if (load < best_load) {
      best = sessions_[i].get();
      best_load = load;
    }
  }
  return *best;
}

SessionPool::Lease SessionPool::acquire() {
  return lease(select_session());
}

SessionPool::Lease SessionPool::lease(Session& s) {
  adjust(s, 1);
  return Lease(&s);
}

void SessionPool::adjust(Session& s, int64_t delta) {
  s.workload_.fetch_add(delta, std::memory_order_acq_rel);
}

} // namespace sgw
