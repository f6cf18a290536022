#pragma once

#include <string>
#include <cstddef>
#include <optional>
#include <filesystem>

#include <boost/json/value.hpp>

#include <gogsync/catalog/catalog-source.hxx>

namespace gogsync
{
  namespace fs = std::filesystem;
  namespace json = boost::json;

  // Catalog stored as a JSON document:
  //
  // {
  //   "games": [
  //     {
  //       "id": 1207664663,
  //       "title": "The Witcher 3",
  //       "downloads": [
  //         {
  //           "name": "The Witcher 3",
  //           "language": "English",
  //           "platform": "windows",
  //           "url": "https://...",
  //           "size": 1024,
  //           "md5": "..."          (optional)
  //           "filename": "..."     (optional)
  //         }
  //       ]
  //     }
  //   ]
  // }
  //
  // A bare top-level array of games is accepted as well. The document is
  // parsed up front, entries are converted lazily as they are pulled.
  //
  class json_catalog: public catalog_source
  {
  public:
    // Throw std::runtime_error if the file cannot be read or is not a
    // catalog document.
    //
    explicit
    json_catalog (const fs::path& file);

    // Parse from an in-memory document.
    //
    explicit
    json_catalog (const std::string& text);

    json_catalog (const json_catalog&) = delete;
    json_catalog& operator= (const json_catalog&) = delete;

    std::optional<game_entry>
    next () override;

    std::size_t
    size () const noexcept;

  private:
    void
    init (const std::string& text, const std::string& origin);

    json::value doc_;
    const json::array* games_ {nullptr};
    std::size_t pos_ {0};
    std::string origin_;
  };

  // Convert a single JSON object. Throw std::invalid_argument describing the
  // first missing or mistyped member.
  //
  download_descriptor
  parse_download (const json::value&);

  game_entry
  parse_game (const json::value&);
}
