#pragma once

#include "streaming/client_sink.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace scopecam::streaming {

// Concurrency-safe set of connected clients.
class ClientRegistry {
public:
  using SinkPtr = std::shared_ptr<IClientSink>;

  // Returns the registry size after the insert. Re-adding a member is a
  // no-op.
  std::size_t Add(const SinkPtr& sink);

  // Returns the registry size after the removal.
  std::size_t Remove(const SinkPtr& sink);

  bool Contains(const SinkPtr& sink) const;
  std::size_t Size() const;
  bool Empty() const;

  // Copy of the members for one broadcast; sends happen outside the lock.
  std::vector<SinkPtr> Members() const;

private:
  mutable std::mutex mu_;
  std::set<SinkPtr> members_;
};

} // namespace scopecam::streaming
