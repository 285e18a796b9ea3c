#pragma once

#include "core/types.hpp"
#include <optional>

namespace seasonal {

MicroSeason default_micro_season(ParentSeason parent);

// Maps a coarse color profile to one micro-season. Branch order within each
// parent season is significant. Vivid clarity is treated as clear.
MicroSeason determine_micro_season(ParentSeason parent,
                                   std::optional<Depth> depth = std::nullopt,
                                   std::optional<Clarity> clarity = std::nullopt,
                                   std::optional<Undertone> undertone = std::nullopt);

}
