#pragma once

#include <chrono>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/system/error_code.hpp>

#include <gogsync/transfer/transfer-types.hxx>

namespace gogsync
{
  namespace asio = boost::asio;
  namespace beast = boost::beast;

  using transfer_parser =
    beast::http::response_parser<beast::http::buffer_body>;

  // Connection a response body is read from.
  //
  // Plain TCP and TLS streams have different types but the body is read the
  // same way, so the stream only sees this interface.
  //
  class transfer_connection
  {
  public:
    virtual
    ~transfer_connection () = default;

    // Read some of the body into the parser's buffer. Errors are reported
    // through ec rather than thrown (need_buffer is a normal outcome).
    //
    virtual asio::awaitable<std::size_t>
    read_some (beast::flat_buffer&,
               transfer_parser&,
               boost::system::error_code& ec) = 0;

    virtual void
    expires_after (std::chrono::steady_clock::duration) = 0;

    virtual void
    close () noexcept = 0;
  };

  // Connection over a concrete Beast stream (beast::tcp_stream or
  // beast::ssl_stream<beast::tcp_stream>).
  //
  template <typename S>
  class basic_transfer_connection: public transfer_connection
  {
  public:
    using stream_type = S;

    template <typename... A>
    explicit
    basic_transfer_connection (A&&... a)
      : stream_ (std::forward<A> (a)...)
    {
    }

    stream_type&
    stream () noexcept
    {
      return stream_;
    }

    asio::awaitable<std::size_t>
    read_some (beast::flat_buffer&,
               transfer_parser&,
               boost::system::error_code&) override;

    void
    expires_after (std::chrono::steady_clock::duration) override;

    void
    close () noexcept override;

  private:
    stream_type stream_;
  };

  // Body of one download response as a lazy, single-pass sequence of chunks.
  //
  // Nothing is buffered beyond the chunk being handed out: every call to
  // next() reads from the network, waiting at most the idle timeout for
  // data to arrive.
  //
  template <typename T = transfer_traits<>>
  class basic_transfer_stream
  {
  public:
    using traits_type = T;
    using duration = std::chrono::steady_clock::duration;

    basic_transfer_stream () = default;

    basic_transfer_stream (std::unique_ptr<transfer_connection> c,
                           std::unique_ptr<transfer_parser> p,
                           beast::flat_buffer b,
                           std::uint64_t offset,
                           std::uint64_t total,
                           duration idle_timeout,
                           transfer_progress progress,
                           std::size_t chunk_size);

    basic_transfer_stream (basic_transfer_stream&&) = default;
    basic_transfer_stream& operator= (basic_transfer_stream&&) = default;

    basic_transfer_stream (const basic_transfer_stream&) = delete;
    basic_transfer_stream& operator= (const basic_transfer_stream&) = delete;

    ~basic_transfer_stream ();

    // Fill the chunk with the next piece of the body. Return false (and an
    // empty chunk) once the body is complete. Throw timeout_error if no data
    // arrives within the idle timeout and transport_error on any other
    // network failure.
    //
    asio::awaitable<bool>
    next (transfer_chunk&);

    // Byte the response starts at (0 unless resuming).
    //
    std::uint64_t
    offset () const noexcept
    {
      return offset_;
    }

    // Full size of the file or 0 if the server did not say.
    //
    std::uint64_t
    total () const noexcept
    {
      return total_;
    }

    // Body bytes handed out so far.
    //
    std::uint64_t
    received () const noexcept
    {
      return received_;
    }

    bool
    done () const noexcept
    {
      return conn_ == nullptr;
    }

  private:
    void
    close () noexcept;

    std::unique_ptr<transfer_connection> conn_;
    std::unique_ptr<transfer_parser> parser_;
    beast::flat_buffer buffer_;

    std::uint64_t offset_ {0};
    std::uint64_t total_ {0};
    std::uint64_t received_ {0};

    duration idle_ {};
    transfer_progress progress_;
    std::size_t chunk_size_ {0};
  };

  using transfer_stream = basic_transfer_stream<>;
}

#include <gogsync/transfer/transfer-stream.txx>
