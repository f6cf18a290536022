#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>

#include <gogsync/gogsync-error.hxx>

namespace gogsync
{
  // basic_transfer_connection
  //
  template <typename S>
  asio::awaitable<std::size_t> basic_transfer_connection<S>::
  read_some (beast::flat_buffer& b,
             transfer_parser& p,
             boost::system::error_code& ec)
  {
    co_return co_await beast::http::async_read_some (
      stream_, b, p, asio::redirect_error (asio::use_awaitable, ec));
  }

  template <typename S>
  void basic_transfer_connection<S>::
  expires_after (std::chrono::steady_clock::duration d)
  {
    beast::get_lowest_layer (stream_).expires_after (d);
  }

  // Note that we don't attempt a TLS shutdown: plenty of CDN servers never
  // answer close_notify and we would just sit there until the timeout.
  //
  template <typename S>
  void basic_transfer_connection<S>::
  close () noexcept
  {
    using tcp = asio::ip::tcp;

    auto& l (beast::get_lowest_layer (stream_));

    boost::system::error_code ec;
    l.socket ().shutdown (tcp::socket::shutdown_both, ec);
    l.socket ().close (ec);
  }

  // basic_transfer_stream
  //
  template <typename T>
  basic_transfer_stream<T>::
  basic_transfer_stream (std::unique_ptr<transfer_connection> c,
                         std::unique_ptr<transfer_parser> p,
                         beast::flat_buffer b,
                         std::uint64_t offset,
                         std::uint64_t total,
                         duration idle,
                         transfer_progress progress,
                         std::size_t chunk_size)
    : conn_ (std::move (c)),
      parser_ (std::move (p)),
      buffer_ (std::move (b)),
      offset_ (offset),
      total_ (total),
      idle_ (idle),
      progress_ (std::move (progress)),
      chunk_size_ (chunk_size)
  {
  }

  template <typename T>
  basic_transfer_stream<T>::
  ~basic_transfer_stream ()
  {
    close ();
  }

  template <typename T>
  void basic_transfer_stream<T>::
  close () noexcept
  {
    if (conn_ != nullptr)
    {
      conn_->close ();
      conn_.reset ();
    }
  }

  template <typename T>
  asio::awaitable<bool> basic_transfer_stream<T>::
  next (transfer_chunk& c)
  {
    namespace http = beast::http;

    c.clear ();

    if (conn_ == nullptr)
      co_return false;

    while (!parser_->is_done ())
    {
      c.resize (chunk_size_);

      auto& body (parser_->get ().body ());
      body.data = c.data ();
      body.size = c.size ();

      // The idle window restarts with every read, so a slow but steady
      // transfer never times out.
      //
      boost::system::error_code ec;
      conn_->expires_after (idle_);
      co_await conn_->read_some (buffer_, *parser_, ec);

      std::size_t n (c.size () - body.size);
      c.resize (n);

      // The buffer filled up, which is just what we asked for.
      //
      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
      {
        close ();

        std::string at (std::to_string (offset_ + received_));

        if (ec == beast::error::timeout)
          throw timeout_error ("no data received within idle timeout at byte " +
                               at);

        throw transport_error ("transfer interrupted at byte " + at + ": " +
                               ec.message ());
      }

      if (n != 0)
      {
        received_ += n;

        if (progress_)
          progress_ (offset_ + received_, total_);

        co_return true;
      }
    }

    close ();
    co_return false;
  }
}
