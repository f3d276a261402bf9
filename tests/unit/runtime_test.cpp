#include "internal/runtime/periodic_worker.hpp"
#include "internal/runtime/server.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 2s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

void TestWorkerTicksUntilStopped() {
  std::atomic<int>                  ticks{0};
  flotilla::runtime::PeriodicWorker worker("ticker", 10ms, [&] { ++ticks; });
  worker.Start();
  worker.Start();
  assert(WaitFor([&] { return ticks.load() >= 3; }));

  worker.Stop();
  const int after_stop = ticks.load();
  std::this_thread::sleep_for(50ms);
  assert(ticks.load() == after_stop);
}

void TestWorkerSurvivesFailingTask() {
  std::atomic<int>                  calls{0};
  flotilla::runtime::PeriodicWorker worker("flaky", 5ms, [&] {
    ++calls;
    throw std::runtime_error("tick failed");
  });
  worker.Start();
  assert(WaitFor([&] { return calls.load() >= 2; }));
}

void TestStopBeforeStartIsHarmless() {
  flotilla::runtime::PeriodicWorker worker("idle", 1s, [] {});
  worker.Stop();
}

void TestServerBindsEphemeralPort() {
  flotilla::runtime::Server server("127.0.0.1:0", {});
  server.Start();
  assert(server.Port() > 0);
  server.Stop(100ms);
  server.Stop();
}

void TestServerRejectsUnusableAddress() {
  flotilla::runtime::Server server("not-an-address::99999", {});
  bool                      threw = false;
  try {
    server.Start();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUuidShape() {
  const auto id = flotilla::util::NewUuid();
  assert(id.size() == 36);
  assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
  assert(id[14] == '4');
  assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
  assert(id != flotilla::util::NewUuid());
  assert(flotilla::util::RandomToken(8).size() == 16);
}

void TestMillisConversion() {
  const auto ts = flotilla::util::MillisToProto(1700000000123);
  assert(ts.seconds() == 1700000000);
  assert(ts.nanos() == 123000000);
  assert(flotilla::util::ProtoToMillis(ts) == 1700000000123);

  google::protobuf::Timestamp before_epoch;
  before_epoch.set_seconds(-5);
  assert(flotilla::util::ProtoToMillis(before_epoch) == 0);
  assert(flotilla::util::NowMillis() > 1700000000000);
}

} // namespace

int main() {
  TestWorkerTicksUntilStopped();
  TestWorkerSurvivesFailingTask();
  TestStopBeforeStartIsHarmless();
  TestServerBindsEphemeralPort();
  TestServerRejectsUnusableAddress();
  TestUuidShape();
  TestMillisConversion();
  std::cout << "flotilla_unit_runtime: pass" << std::endl;
  return 0;
}
