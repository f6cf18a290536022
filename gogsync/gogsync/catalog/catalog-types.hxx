#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <optional>

namespace gogsync
{
  // Target platform of a download.
  //
  enum class platform
  {
    windows,
    mac,
    linux_
  };

  std::string
  to_string (platform);

  // Throw std::invalid_argument if the name is not a known platform.
  //
  platform
  to_platform (const std::string&);

  // Return nullopt if the name is not a known platform.
  //
  std::optional<platform>
  parse_platform (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, platform p)
  {
    return os << to_string (p);
  }

  // Local name of the language the store uses for its English builds. The
  // fallback resolution compares against it.
  //
  inline const std::string english_language ("English");

  // Metadata of one downloadable file of a game (installer, patch, etc).
  //
  struct download_descriptor
  {
    std::string name;
    std::string language; // Store-local language name.
    gogsync::platform platform {gogsync::platform::windows};
    std::string url;
    std::uint64_t size {0};

    // Content hash (MD5 hex), if the store publishes one.
    //
    std::optional<std::string> md5;

    // Explicit on-disk file name, if the catalog knows it.
    //
    std::optional<std::string> filename;

    // Short description used in diagnostics: name (platform, language).
    //
    std::string
    label () const;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_descriptor& d)
  {
    return os << d.label ();
  }

  // An owned game and its downloads, in catalog order.
  //
  struct game_entry
  {
    std::uint64_t id {0};
    std::string title;
    std::vector<download_descriptor> downloads;
  };
}
