#include "session_table.hpp"

#include "internal/observability/logging.hpp"

namespace upload::session {

using observability::IntField;

SessionTable::SessionTable(std::shared_ptr<registry::SessionRegistry> registry, storage::ChunkBufferPtr buffer,
                           std::shared_ptr<notify::CompletionQueue> completions, StateMachineOptions options)
    : registry_(std::move(registry)), buffer_(std::move(buffer)), completions_(std::move(completions)), options_(options) {
}

std::shared_ptr<UploadStateMachine> SessionTable::Acquire(const std::string& token) {
  std::lock_guard lock(mutex_);

  auto& slot = machines_[token];
  if (auto machine = slot.lock()) {
    return machine;
  }

  auto machine = std::make_shared<UploadStateMachine>(token, registry_, buffer_, completions_, options_);
  slot         = machine;
  return machine;
}

std::size_t SessionTable::SweepExpired() {
  const auto tokens = registry_->SweepExpired();
  for (const auto& token : tokens) {
    Acquire(token)->OnExpired();
  }
  if (!tokens.empty()) {
    UPLOAD_LOG_INFO("expired sessions swept", {IntField("count", static_cast<int64_t>(tokens.size()))});
  }
  return tokens.size();
}

std::size_t SessionTable::PurgeTerminal(std::chrono::milliseconds retention) {
  const auto purged = registry_->PurgeTerminal(retention);
  for (const auto& record : purged) {
    Acquire(record.token)->OnPurged();
  }
  if (!purged.empty()) {
    UPLOAD_LOG_INFO("terminal sessions purged", {IntField("count", static_cast<int64_t>(purged.size()))});
  }
  return purged.size();
}

std::size_t SessionTable::PublishPendingCompletions() {
  std::size_t published = 0;
  for (const auto& record : registry_->PendingCompletions()) {
    if (Acquire(record.token)->PublishPendingCompletion()) ++published;
  }
  if (published > 0) {
    UPLOAD_LOG_WARN("pending completion events published", {IntField("count", static_cast<int64_t>(published))});
  }
  return published;
}

std::size_t SessionTable::Compact() {
  std::lock_guard lock(mutex_);

  for (auto it = machines_.begin(); it != machines_.end();) {
    if (it->second.expired()) {
      it = machines_.erase(it);
      continue;
    }
    ++it;
  }
  return machines_.size();
}

} // namespace upload::session
