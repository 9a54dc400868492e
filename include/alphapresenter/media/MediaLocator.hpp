// Repository: AlphaPresenter
// Component: Media Locator
// Purpose: Resolves stored media file names against the configured media root.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_MEDIA_MEDIA_LOCATOR_HPP_
#define ALPHAPRESENTER_MEDIA_MEDIA_LOCATOR_HPP_

#include <string>

#include "alphapresenter/model/MetadataProviders.hpp"

namespace alphapresenter::media {

// Relative names resolve under media_root; absolute paths pass through.
class MediaLocator : public model::IMediaLocator {
 public:
  explicit MediaLocator(std::string media_root);

  std::string Resolve(const std::string& file_path) const override;

  // True only for an existing regular file.
  bool Exists(const std::string& file_path) const override;

  const std::string& media_root() const { return media_root_; }

 private:
  std::string media_root_;
};

}  // namespace alphapresenter::media

#endif  // ALPHAPRESENTER_MEDIA_MEDIA_LOCATOR_HPP_
