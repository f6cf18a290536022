#pragma once

#include <vector>
#include <cstddef>
#include <optional>

#include <gogsync/catalog/catalog-types.hxx>

namespace gogsync
{
  // Producer of catalog entries.
  //
  // Entries are pulled one game at a time so that a source backed by a
  // slow producer does not have to be materialized before the first download
  // starts.
  //
  class catalog_source
  {
  public:
    virtual
    ~catalog_source () = default;

    // Return the next game or nullopt once the catalog is exhausted.
    //
    virtual std::optional<game_entry>
    next () = 0;
  };

  // In-memory catalog.
  //
  class vector_catalog: public catalog_source
  {
  public:
    vector_catalog () = default;

    explicit
    vector_catalog (std::vector<game_entry> games)
      : games_ (std::move (games))
    {
    }

    std::optional<game_entry>
    next () override
    {
      if (pos_ == games_.size ())
        return std::nullopt;

      return games_[pos_++];
    }

  private:
    std::vector<game_entry> games_;
    std::size_t pos_ {0};
  };
}
