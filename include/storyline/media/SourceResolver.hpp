// Repository: Storyline
// Component: Source Resolver
// Purpose: Turns (locator, origin) into something libavformat can open.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_SOURCE_RESOLVER_HPP_
#define STORYLINE_MEDIA_SOURCE_RESOLVER_HPP_

#include <string>

#include "storyline/model/StoryTypes.hpp"

namespace storyline::media {

// network: locator unchanged
// file:    "file://" prefix stripped, path unchanged
// asset:   joined to asset_root (unchanged when asset_root is empty or the
//          locator is absolute)
std::string ResolveLocator(const std::string& locator, model::SourceOrigin origin,
                           const std::string& asset_root);

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_SOURCE_RESOLVER_HPP_
