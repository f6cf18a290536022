#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>

#include <gogsync/version.hxx>

namespace gogsync
{
  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path and query.

    // Port is the scheme default.
    //
    bool
    default_port () const;
  };

  // Parse a scheme://host[:port]/target URL. A missing scheme means http.
  //
  // Note that IPv6 literals and user info are not supported, the store does
  // not hand those out.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a redirect Location value against the URL it was received for.
  //
  std::string
  resolve_location (const url_parts& base, const std::string& location);

  // One piece of the response body, in arrival order.
  //
  using transfer_chunk = std::vector<char>;

  // Progress callback: (current bytes, total bytes). Both count from the
  // beginning of the file, so a resumed transfer starts at its offset. Total
  // is 0 while unknown.
  //
  using transfer_progress = std::function<void (std::uint64_t, std::uint64_t)>;

  // Supplies the bearer token for the store API. An empty token means the
  // request goes out unauthenticated.
  //
  using token_provider = std::function<std::string ()>;

  template <typename S = std::string>
  struct transfer_traits
  {
    using string_type = S;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Largest chunk handed out by the stream.
    //
    std::size_t chunk_size = 64 * 1024;

    // Whether to verify the server certificate.
    //
    bool verify_ssl = true;

    string_type user_agent = string_type ("gogsync/" GOGSYNC_VERSION_STR);
  };
}
