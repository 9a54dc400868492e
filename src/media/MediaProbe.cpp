// Repository: AlphaPresenter
// Component: Media Probe
// Purpose: libavformat container duration probe.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/media/MediaProbe.hpp"

#include <sstream>

#include "alphapresenter/util/Logger.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

namespace alphapresenter::media {

namespace {

// Closes the input on every exit path.
class FormatContextGuard {
 public:
  FormatContextGuard() = default;
  ~FormatContextGuard() {
    if (ctx_) avformat_close_input(&ctx_);
  }
  FormatContextGuard(const FormatContextGuard&) = delete;
  FormatContextGuard& operator=(const FormatContextGuard&) = delete;

  AVFormatContext** out() { return &ctx_; }
  AVFormatContext* get() const { return ctx_; }

 private:
  AVFormatContext* ctx_ = nullptr;
};

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

int64_t ProbeDurationMs(const std::string& path) {
  FormatContextGuard format_ctx;

  int ret = avformat_open_input(format_ctx.out(), path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[MediaProbe] OPEN_FAILED path=" << path << " ret=" << ret
        << " err=" << AvErrorString(ret);
    util::Logger::Warn(oss.str());
    return -1;
  }

  ret = avformat_find_stream_info(format_ctx.get(), nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[MediaProbe] STREAM_INFO_FAILED path=" << path << " ret=" << ret
        << " err=" << AvErrorString(ret);
    util::Logger::Warn(oss.str());
    return -1;
  }

  const int64_t duration = format_ctx.get()->duration;
  if (duration == AV_NOPTS_VALUE || duration <= 0) {
    std::ostringstream oss;
    oss << "[MediaProbe] NO_DURATION path=" << path;
    util::Logger::Warn(oss.str());
    return -1;
  }

  // Container duration is in AV_TIME_BASE (microsecond) units.
  const int64_t duration_ms = av_rescale(duration, 1000, AV_TIME_BASE);

  std::ostringstream oss;
  oss << "[MediaProbe] PROBED path=" << path << " duration_ms=" << duration_ms;
  util::Logger::Debug(oss.str());
  return duration_ms;
}

}  // namespace alphapresenter::media
