// Repository: Storyline
// Component: Source Resolver
// Copyright (c) 2025 Storyline

#include "storyline/media/SourceResolver.hpp"

namespace storyline::media {

namespace {
constexpr const char kFileScheme[] = "file://";
}

std::string ResolveLocator(const std::string& locator, model::SourceOrigin origin,
                           const std::string& asset_root) {
  switch (origin) {
    case model::SourceOrigin::kNetwork:
      return locator;
    case model::SourceOrigin::kFile:
      if (locator.rfind(kFileScheme, 0) == 0) {
        return locator.substr(sizeof(kFileScheme) - 1);
      }
      return locator;
    case model::SourceOrigin::kAsset: {
      if (asset_root.empty() || (!locator.empty() && locator.front() == '/')) {
        return locator;
      }
      if (asset_root.back() == '/') return asset_root + locator;
      return asset_root + "/" + locator;
    }
  }
  return locator;
}

}  // namespace storyline::media
