#pragma once
#include <cstdint>

namespace alphapresenter::time {

// Monotonic millisecond clock. All timer deadlines in the core are expressed
// on this clock, never on wall time.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

}  // namespace alphapresenter::time
