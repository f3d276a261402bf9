#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "command_mailbox.hpp"
#include "drone_bus.hpp"

namespace flotilla::bus {

/*
  In-process bus: one mailbox per drone, drained by that drone's Attach
  stream. Commands sent before the drone attaches are buffered.

  A mailbox outlives the stream that drains it, so commands sent while a
  drone is reconnecting wait for the next Attach. A second Attach for the
  same drone takes over the pending commands and shuts the previous
  mailbox down, which ends the older stream. CloseDrone() discards the
  mailbox for good.
*/
class LocalDroneBus final : public DroneBus {
 public:
  void SendSpawn(uint64_t drone_id, const flotilla::v1::SpawnCommand& command) override;
  void SendTerminate(uint64_t drone_id, const flotilla::v1::TerminateCommand& command) override;
  void CloseDrone(uint64_t drone_id) override;

  std::shared_ptr<CommandMailbox> Attach(uint64_t drone_id);

  void Shutdown();

  std::size_t Pending(uint64_t drone_id);

 private:
  std::shared_ptr<CommandMailbox> MailboxLocked(uint64_t drone_id);

  std::mutex                                                    mutex_;
  std::unordered_map<uint64_t, std::shared_ptr<CommandMailbox>> mailboxes_;
  bool                                                          shutdown_ = false;
};

} // namespace flotilla::bus
