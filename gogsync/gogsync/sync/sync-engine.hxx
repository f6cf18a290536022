#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <iostream>
#include <optional>
#include <filesystem>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <gogsync/catalog/catalog-types.hxx>
#include <gogsync/catalog/catalog-source.hxx>
#include <gogsync/hash/hash-calculator.hxx>
#include <gogsync/progress/progress-reporter.hxx>
#include <gogsync/sync/sync-types.hxx>
#include <gogsync/transfer/transfer-engine.hxx>

namespace gogsync
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // The transport is anything with the transfer engine's download() and a
  // stream type with an awaitable next(chunk).
  //
  template <typename T = transfer_engine>
  struct sync_engine_traits
  {
    using transport_type = T;
    using stream_type = typename transport_type::stream_type;

    // Suffix of the checksum sidecar file.
    //
    static constexpr const char* sidecar_suffix = ".md5";
  };

  // Download orchestrator.
  //
  // Walks the catalog one game at a time, decides for each download whether
  // it is filtered out, already present, to be resumed or downloaded from
  // scratch, and drives the transport through the retry coordinator. Games
  // and files are processed strictly in order.
  //
  // Skip decisions and progress go to out, warnings and notes to err.
  //
  template <typename T = sync_engine_traits<>>
  class basic_sync_engine
  {
  public:
    using traits_type = T;
    using transport_type = typename traits_type::transport_type;
    using stream_type = typename traits_type::stream_type;

    basic_sync_engine (transport_type& transport,
                       sync_options options,
                       progress_reporter* progress = nullptr,
                       std::ostream& out = std::cout,
                       std::ostream& err = std::cerr);

    basic_sync_engine (const basic_sync_engine&) = delete;
    basic_sync_engine& operator= (const basic_sync_engine&) = delete;

    // Process every game of the catalog.
    //
    // A download that fails after all attempts ends the run with
    // too_many_retries unless skip_errors is set, in which case it is
    // recorded in the summary and the run goes on.
    //
    asio::awaitable<sync_summary>
    run (catalog_source&);

    // Process every download of one game, returning outcomes in catalog
    // order.
    //
    asio::awaitable<std::vector<sync_outcome>>
    sync_game (const game_entry&);

    // Process one download that passed the filters.
    //
    asio::awaitable<sync_outcome>
    sync_file (const game_entry&, const download_descriptor&);

    const sync_options&
    options () const noexcept
    {
      return options_;
    }

  private:
    // State of one file across its attempts.
    //
    struct transfer_session
    {
      const download_descriptor& descriptor;
      fs::path directory;
      fs::path file;
      std::string label;

      // Set once an attempt of this session created or extended the file.
      //
      bool written {false};
    };

    // Steps from the sidecar to the verification, once.
    //
    asio::awaitable<sync_outcome>
    attempt (transfer_session&);

    void
    write_sidecar (transfer_session&);

    // Existing-file disposition: a skip outcome, or the offset to resume at
    // (nullopt for a fresh download).
    //
    struct disposition
    {
      std::optional<sync_outcome> done;
      std::optional<std::uint64_t> offset;
    };

    disposition
    dispose (transfer_session&);

    asio::awaitable<sync_outcome>
    transfer (transfer_session&, std::optional<std::uint64_t> offset);

    void
    skipped (const download_descriptor&, skip_reason);

  private:
    transport_type& transport_;
    sync_options options_;
    progress_reporter* progress_;
    std::ostream& out_;
    std::ostream& err_;
  };

  using sync_engine = basic_sync_engine<>;
}

#include <gogsync/sync/sync-engine.txx>
