#include "local_drone_bus.hpp"

namespace flotilla::bus {

std::shared_ptr<CommandMailbox> LocalDroneBus::MailboxLocked(uint64_t drone_id) {
  auto& mailbox = mailboxes_[drone_id];
  if (!mailbox) {
    mailbox = std::make_shared<CommandMailbox>();
  }
  return mailbox;
}

void LocalDroneBus::SendSpawn(uint64_t drone_id, const flotilla::v1::SpawnCommand& command) {
  flotilla::v1::DroneCommand envelope;
  *envelope.mutable_spawn() = command;

  std::shared_ptr<CommandMailbox> mailbox;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    mailbox = MailboxLocked(drone_id);
  }
  mailbox->Enqueue(envelope);
}

void LocalDroneBus::SendTerminate(uint64_t drone_id, const flotilla::v1::TerminateCommand& command) {
  flotilla::v1::DroneCommand envelope;
  *envelope.mutable_terminate() = command;

  std::shared_ptr<CommandMailbox> mailbox;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    mailbox = MailboxLocked(drone_id);
  }
  mailbox->Enqueue(envelope);
}

void LocalDroneBus::CloseDrone(uint64_t drone_id) {
  std::shared_ptr<CommandMailbox> mailbox;
  {
    std::lock_guard lock(mutex_);
    auto it = mailboxes_.find(drone_id);
    if (it == mailboxes_.end()) return;
    mailbox = std::move(it->second);
    mailboxes_.erase(it);
  }
  mailbox->Shutdown();
}

std::shared_ptr<CommandMailbox> LocalDroneBus::Attach(uint64_t drone_id) {
  auto fresh = std::make_shared<CommandMailbox>();

  std::shared_ptr<CommandMailbox> previous;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      fresh->Shutdown();
      return fresh;
    }
    auto& slot = mailboxes_[drone_id];
    previous   = std::move(slot);
    slot       = fresh;
  }

  if (previous) {
    previous->Shutdown();
    for (auto& command : previous->Drain()) {
      fresh->Enqueue(command);
    }
  }
  return fresh;
}

void LocalDroneBus::Shutdown() {
  std::unordered_map<uint64_t, std::shared_ptr<CommandMailbox>> mailboxes;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    mailboxes.swap(mailboxes_);
  }
  for (auto& [_, mailbox] : mailboxes) {
    mailbox->Shutdown();
  }
}

std::size_t LocalDroneBus::Pending(uint64_t drone_id) {
  std::lock_guard lock(mutex_);
  auto it = mailboxes_.find(drone_id);
  return it == mailboxes_.end() ? 0 : it->second->Size();
}

} // namespace flotilla::bus
