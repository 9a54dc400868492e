#pragma once
#include "alphapresenter/time/ITimeSource.hpp"
#include <chrono>

namespace alphapresenter::time {

class SteadyTimeSource : public ITimeSource {
public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace alphapresenter::time
