#include "DestinationResolver.hpp"

#include <format>
#include <system_error>

#include "IOManager.hpp"
#include "utils.hpp"

DirectoryDestinationResolver::DirectoryDestinationResolver(
    fs::path baseDir, std::optional<fs::path> homeDir)
    : m_baseDir(std::move(baseDir)), m_homeDir(std::move(homeDir)) {}

std::optional<Destination> DirectoryDestinationResolver::resolve(
    const Destination& placeholder) const {
  if (placeholder.is_trash()) return placeholder;
  if (!placeholder.needs_resolution()) return placeholder;

  const std::string& display = placeholder.display_path;
  if (display.empty()) return std::nullopt;

  fs::path candidate;
  if (display == "~" || display.starts_with("~/")) {
    if (!m_homeDir) {
      IOManager::log(std::format(
          "Warning: Cannot expand '{}' without a home directory.", display));
      return std::nullopt;
    }
    candidate = *m_homeDir / (display.size() > 2 ? display.substr(2) : "");
  } else {
    candidate = fs::path(display);
    if (candidate.is_relative()) candidate = m_baseDir / candidate;
  }

  std::error_code ec;
  if (!fs::is_directory(candidate, ec)) return std::nullopt;

  const fs::path canonical = fs::canonical(candidate, ec);
  if (ec) {
    IOManager::log(std::format("Warning: Could not canonicalize '{}': {}",
                               safe_path_to_string(candidate), ec.message()));
    return std::nullopt;
  }
  return Destination::resolved_folder(display, safe_path_to_string(canonical));
}
