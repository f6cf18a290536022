#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <optional>
#include <exception>
#include <filesystem>

#include <gogsync/catalog/catalog-types.hxx>

namespace gogsync
{
  namespace fs = std::filesystem;

  // Run configuration. Resolved once before the first game is looked at.
  //
  struct sync_options
  {
    fs::path target_directory;

    std::optional<platform> operating_system;
    std::optional<std::string> language;
    bool english_fallback {false};
    std::optional<std::string> exclude_language;

    std::size_t retry_count {3};
    std::chrono::steady_clock::duration retry_delay {std::chrono::seconds (1)};
    std::chrono::steady_clock::duration idle_timeout {std::chrono::seconds (3)};

    bool skip_errors {false};
    bool dry_run {false};
    bool create_md5 {false};
    bool no_verify {false};

    // 0 quiet, 1 normal, 2 verbose, 3 very verbose.
    //
    std::uint16_t verbosity {1};
  };

  // Why a download was not transferred.
  //
  enum class skip_reason
  {
    os_filter,
    language_filter,
    excluded_language,
    existing_valid,
    existing_untrusted
  };

  // Return the reason as it completes "Skipping because ...".
  //
  std::string
  to_string (skip_reason);

  inline std::ostream&
  operator<< (std::ostream& os, skip_reason r)
  {
    return os << to_string (r);
  }

  enum class sync_status
  {
    completed,
    skipped,
    failed
  };

  std::string
  to_string (sync_status);

  inline std::ostream&
  operator<< (std::ostream& os, sync_status s)
  {
    return os << to_string (s);
  }

  // Result of processing one download.
  //
  struct sync_outcome
  {
    sync_status status {sync_status::completed};

    std::optional<skip_reason> reason; // Set if skipped.
    std::exception_ptr error;          // Set if failed.
    std::string message;               // Error description if failed.

    // Bytes received (declared size for a dry run).
    //
    std::uint64_t bytes {0};

    bool hash_mismatch {false};
    bool dry_run {false};

    static sync_outcome
    completed (std::uint64_t bytes, bool mismatch = false);

    static sync_outcome
    skipped (skip_reason);

    static sync_outcome
    failed (std::exception_ptr, std::string message);
  };

  // Totals of a run.
  //
  struct sync_summary
  {
    std::size_t completed {0};
    std::size_t skipped {0};
    std::size_t failed {0};
    std::size_t hash_mismatches {0};
    std::uint64_t bytes {0};

    void
    add (const sync_outcome&);

    std::size_t
    total () const noexcept
    {
      return completed + skipped + failed;
    }
  };
}
