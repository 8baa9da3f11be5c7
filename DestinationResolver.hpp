#pragma once

#include <optional>

#include "types.hpp"

// Turns a placeholder folder destination into one backed by a concrete,
// access-granted location. Returns std::nullopt when that is not possible.
class DestinationResolver {
 public:
  virtual ~DestinationResolver() = default;

  virtual std::optional<Destination> resolve(
      const Destination& placeholder) const = 0;
};

// Resolves display paths onto existing directories. "~" expands to the home
// directory, relative paths are taken relative to the base directory. The
// access token is the canonical directory path.
class DirectoryDestinationResolver : public DestinationResolver {
 public:
  DirectoryDestinationResolver(fs::path baseDir,
                               std::optional<fs::path> homeDir);

  std::optional<Destination> resolve(
      const Destination& placeholder) const override;

 private:
  fs::path m_baseDir;
  std::optional<fs::path> m_homeDir;
};
