#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <gogsync/catalog/catalog-types.hxx>
#include <gogsync/transfer/transfer-types.hxx>
#include <gogsync/transfer/transfer-stream.hxx>

namespace gogsync
{
  namespace asio = boost::asio;
  namespace ssl = boost::asio::ssl;

  // Resumable HTTP download of a single file.
  //
  // This is pure transport: the engine neither writes to disk nor looks at
  // the content. It opens the response, checks that it is the one we asked
  // for, and hands back the body as a stream of chunks.
  //
  template <typename T = transfer_traits<>>
  class basic_transfer_engine
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using stream_type = basic_transfer_stream<traits_type>;
    using duration = std::chrono::steady_clock::duration;

    explicit
    basic_transfer_engine (asio::io_context& ioc,
                           token_provider token = nullptr);

    basic_transfer_engine (asio::io_context& ioc,
                           const traits_type& traits,
                           token_provider token = nullptr);

    basic_transfer_engine (const basic_transfer_engine&) = delete;
    basic_transfer_engine& operator= (const basic_transfer_engine&) = delete;

    // Start downloading the descriptor's file.
    //
    // If offset is present and non-zero, ask for the content starting at
    // that byte and require the server to honor it. The idle timeout bounds
    // every network wait, including the ones in the returned stream.
    //
    // Throw timeout_error if the server goes quiet and transport_error for
    // any other failure (including unexpected HTTP statuses).
    //
    asio::awaitable<stream_type>
    download (const download_descriptor& d,
              transfer_progress progress,
              std::optional<std::uint64_t> offset,
              duration idle_timeout);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    struct request_state
    {
      std::string auth_host;   // Host the token may be sent to.
      std::uint64_t offset;    // 0 means the whole file.
      duration idle;
      transfer_progress progress;
    };

    asio::awaitable<stream_type>
    open (std::string url, request_state& s, std::uint8_t redirects);

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_;
    token_provider token_;
  };

  using transfer_engine = basic_transfer_engine<>;

  // Extract the complete length from a Content-Range value such as
  // "bytes 100-199/200". Return nullopt if it is absent or unknown ("*").
  //
  std::optional<std::uint64_t>
  content_range_total (const std::string&);

  // Extract the first byte position from a Content-Range value.
  //
  std::optional<std::uint64_t>
  content_range_first (const std::string&);

  // Resolve host and port with the resolver, giving up after the idle
  // timeout with timeout_error. Other resolution failures are thrown as
  // boost::system::system_error.
  //
  // The resolver only needs async_resolve() and cancel().
  //
  template <typename R>
  asio::awaitable<typename R::results_type>
  resolve_host (R& resolver,
                std::string host,
                std::string port,
                std::chrono::steady_clock::duration idle_timeout);
}

#include <gogsync/transfer/transfer-engine.txx>
