// Repository: AlphaPresenter
// Component: Metadata Provider Contracts
// Purpose: Read-only lookups the orchestration core performs against the
//          file-backed track, program and paragraph stores.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_MODEL_METADATA_PROVIDERS_HPP_
#define ALPHAPRESENTER_MODEL_METADATA_PROVIDERS_HPP_

#include <optional>
#include <string>

#include "alphapresenter/model/PresentationTypes.hpp"

namespace alphapresenter::model {

// All lookups are synchronous. std::nullopt means "not found".

class ITrackMetadataProvider {
 public:
  virtual ~ITrackMetadataProvider() = default;
  virtual std::optional<TrackMetadata> LoadTrackMetadata(
      const std::string& track_name) const = 0;
};

class IProgramProvider {
 public:
  virtual ~IProgramProvider() = default;
  virtual std::optional<AudioProgram> LoadProgram(
      const std::string& program_name) const = 0;
};

class IParagraphProvider {
 public:
  virtual ~IParagraphProvider() = default;
  virtual std::optional<Paragraph> LoadParagraph(
      const std::string& paragraph_name) const = 0;
};

// Maps a track's stored file name to something the playback engine can open.
class IMediaLocator {
 public:
  virtual ~IMediaLocator() = default;
  virtual std::string Resolve(const std::string& file_path) const = 0;
  virtual bool Exists(const std::string& file_path) const = 0;
};

// Non-owning bundle handed to the components that need several providers.
struct Catalog {
  const ITrackMetadataProvider* tracks = nullptr;
  const IProgramProvider* programs = nullptr;
  const IParagraphProvider* paragraphs = nullptr;
  const IMediaLocator* locator = nullptr;
};

}  // namespace alphapresenter::model

#endif  // ALPHAPRESENTER_MODEL_METADATA_PROVIDERS_HPP_
