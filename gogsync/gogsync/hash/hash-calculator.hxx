#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <filesystem>

struct evp_md_ctx_st;

namespace gogsync
{
  namespace fs = std::filesystem;

  // Incremental MD5 digest.
  //
  // Wraps an OpenSSL EVP context. The context can be fed from memory or from
  // a file on disk, the latter being how a resumed transfer seeds the running
  // digest with the bytes it already has.
  //
  class hash_context
  {
  public:
    // Size of the blocks read from disk.
    //
    static constexpr std::size_t block_size = 64 * 1024;

    hash_context ();
    ~hash_context ();

    hash_context (hash_context&&) noexcept;
    hash_context& operator= (hash_context&&) noexcept;

    hash_context (const hash_context&) = delete;
    hash_context& operator= (const hash_context&) = delete;

    void
    update (const void* data, std::size_t size);

    void
    update (const std::string& data)
    {
      update (data.data (), data.size ());
    }

    // Feed the first limit bytes of the file (the whole file if limit is
    // absent) and return the number of bytes consumed. Throw io_error if the
    // file cannot be opened or read, or is shorter than limit.
    //
    std::uint64_t
    update (const fs::path& file,
            std::optional<std::uint64_t> limit = std::nullopt);

    // Return the lowercase hex digest. The context cannot be updated
    // afterwards.
    //
    std::string
    finalize ();

  private:
    struct deleter
    {
      void
      operator() (evp_md_ctx_st*) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, deleter> ctx_;
  };

  // Compute the MD5 digest of a file, streaming it in blocks.
  //
  std::string
  hash_file (const fs::path& file);

  // Compare two hex digests (case-insensitive).
  //
  bool
  compare_hashes (const std::string& x, const std::string& y);
}
