// Repository: AlphaPresenter
// Component: Media Locator
// Purpose: Resolves stored media file names against the configured media root.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/media/MediaLocator.hpp"

#include <filesystem>
#include <system_error>

namespace alphapresenter::media {

namespace fs = std::filesystem;

MediaLocator::MediaLocator(std::string media_root)
    : media_root_(std::move(media_root)) {}

std::string MediaLocator::Resolve(const std::string& file_path) const {
  if (file_path.empty()) return {};
  fs::path path(file_path);
  if (path.is_absolute() || media_root_.empty()) {
    return path.lexically_normal().string();
  }
  return (fs::path(media_root_) / path).lexically_normal().string();
}

bool MediaLocator::Exists(const std::string& file_path) const {
  if (file_path.empty()) return false;
  std::error_code ec;
  return fs::is_regular_file(Resolve(file_path), ec);
}

}  // namespace alphapresenter::media
