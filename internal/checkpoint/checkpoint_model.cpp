#include "internal/checkpoint/checkpoint_model.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace codeintel::checkpoint {

std::optional<int> ReservedWriteIndex(const std::string& channel) {
  // negative rather than small non-negative values, so they never collide
  // with positional indices; same values as the agent runtime's index map
  if (channel == kErrorChannel) return -1;
  if (channel == kScheduledChannel) return -2;
  if (channel == kInterruptChannel) return -3;
  if (channel == kResumeChannel) return -4;
  return std::nullopt;
}

std::string NewCheckpointId() {
  // strictly increasing within the process, even inside one microsecond
  static std::atomic<uint64_t> last{0};

  const uint64_t now  = util::ToUnixMicros(util::Now());
  uint64_t       prev = last.load();
  uint64_t       next = 0;
  do {
    next = now > prev ? now : prev + 1;
  } while (!last.compare_exchange_weak(prev, next));

  char micros[17];
  std::snprintf(micros, sizeof(micros), "%016llx", static_cast<unsigned long long>(next));
  return std::string(micros) + "-" + util::RandomHex(8);
}

} // namespace codeintel::checkpoint
