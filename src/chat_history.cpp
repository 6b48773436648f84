#include "chat_history.hpp"
#include <algorithm>

ChatHistory::ChatHistory(size_t cap) : cap_(std::max<size_t>(1, cap)) {}

void ChatHistory::append(ChatMessage msg) {
  std::lock_guard<std::mutex> lk(mu_);
  items_.push_back(std::move(msg));
  while (items_.size() > cap_) items_.pop_front();
  version_++;
}

std::vector<ChatMessage> ChatHistory::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::vector<ChatMessage>(items_.begin(), items_.end());
}

bool ChatHistory::snapshot_if_newer(uint64_t& seen, std::vector<ChatMessage>& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (version_ == seen) return false;
  out.assign(items_.begin(), items_.end());
  seen = version_;
  return true;
}

size_t ChatHistory::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return items_.size();
}

uint64_t ChatHistory::version() const {
  std::lock_guard<std::mutex> lk(mu_);
  return version_;
}
