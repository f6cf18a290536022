#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <filesystem>

#include <gogsync/catalog/catalog-types.hxx>
#include <gogsync/sync/sync-types.hxx>

namespace gogsync
{
  namespace fs = std::filesystem;

  // Replace every character outside [A-Za-z0-9._-] with '_' and collapse
  // runs of underscores.
  //
  std::string
  sanitize_title (const std::string&);

  // Directory the game's files go into: <base>/<sanitized title>. A title
  // that sanitizes to nothing is replaced with the game id.
  //
  fs::path
  target_directory (const fs::path& base, const game_entry&);

  // On-disk name of the descriptor's file: the explicit file name, else the
  // last segment of the URL path, else the descriptor name. Always a single
  // path component.
  //
  std::string
  target_filename (const download_descriptor&);

  // Indexes of the game's downloads that survive language fallback
  // resolution, in catalog order.
  //
  // If both a language and the English fallback are requested, keep the
  // downloads in that language, or the English ones if there are none.
  // Otherwise keep everything (the per-file language filter applies later).
  //
  std::vector<std::size_t>
  resolve_downloads (const game_entry&, const sync_options&);

  // Return true if any of the resolved downloads is in the excluded
  // language, in which case the whole game is skipped.
  //
  bool
  excluded (const game_entry&,
            const std::vector<std::size_t>& resolved,
            const sync_options&);

  // Per-file OS and language filters, in that order. Return nullopt if the
  // download passes.
  //
  std::optional<skip_reason>
  filter (const download_descriptor&, const sync_options&);

  // Decide every download of the game: the skip reason, or nullopt for a
  // transfer candidate. Fallback resolution and the exclusion veto are
  // evaluated once for the game before the per-file filters.
  //
  std::vector<std::optional<skip_reason>>
  plan_game (const game_entry&, const sync_options&);
}
