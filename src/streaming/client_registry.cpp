#include "streaming/client_registry.hpp"

namespace scopecam::streaming {

std::size_t ClientRegistry::Add(const SinkPtr& sink) {
  std::lock_guard<std::mutex> lock(mu_);
  if (sink != nullptr) {
    members_.insert(sink);
  }
  return members_.size();
}

std::size_t ClientRegistry::Remove(const SinkPtr& sink) {
  std::lock_guard<std::mutex> lock(mu_);
  members_.erase(sink);
  return members_.size();
}

bool ClientRegistry::Contains(const SinkPtr& sink) const {
  std::lock_guard<std::mutex> lock(mu_);
  return members_.count(sink) != 0U;
}

std::size_t ClientRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return members_.size();
}

bool ClientRegistry::Empty() const {
  std::lock_guard<std::mutex> lock(mu_);
  return members_.empty();
}

std::vector<ClientRegistry::SinkPtr> ClientRegistry::Members() const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::vector<SinkPtr>(members_.begin(), members_.end());
}

} // namespace scopecam::streaming
