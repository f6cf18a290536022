#include <limits>
#include <memory>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <gogsync/gogsync-error.hxx>

namespace gogsync
{
  template <typename T>
  basic_transfer_engine<T>::
  basic_transfer_engine (asio::io_context& ioc, token_provider t)
    : basic_transfer_engine (ioc, traits_type (), std::move (t))
  {
  }

  template <typename T>
  basic_transfer_engine<T>::
  basic_transfer_engine (asio::io_context& ioc,
                         const traits_type& traits,
                         token_provider t)
    : ioc_ (ioc),
      traits_ (traits),
      ssl_ (ssl::context::tlsv12_client),
      token_ (std::move (t))
  {
    if (traits_.verify_ssl)
    {
      ssl_.set_default_verify_paths ();
      ssl_.set_verify_mode (ssl::verify_peer);
    }
    else
      ssl_.set_verify_mode (ssl::verify_none);
  }

  template <typename T>
  asio::awaitable<typename basic_transfer_engine<T>::stream_type>
  basic_transfer_engine<T>::
  download (const download_descriptor& d,
            transfer_progress progress,
            std::optional<std::uint64_t> offset,
            duration idle)
  {
    request_state s {parse_url (d.url).host,
                     offset ? *offset : 0,
                     idle,
                     std::move (progress)};

    co_return co_await open (d.url, s, 0);
  }

  template <typename T>
  asio::awaitable<typename basic_transfer_engine<T>::stream_type>
  basic_transfer_engine<T>::
  open (std::string url, request_state& st, std::uint8_t redirects)
  {
    namespace http = beast::http;
    using tcp = asio::ip::tcp;

    if (redirects > traits_.max_redirects)
      throw transport_error ("maximum redirects exceeded for " + url);

    url_parts u (parse_url (url));

    if (u.scheme != "http" && u.scheme != "https")
      throw transport_error ("unsupported URL scheme '" + u.scheme + "'");

    bool tls (u.scheme == "https");

    // Prepare the request.
    //
    // Note that the Range header stays the same across redirects: the CDN we
    // end up on must serve the same bytes.
    //
    http::request<http::empty_body> rq (http::verb::get, u.target, 11);
    rq.set (http::field::host,
            u.default_port () ? u.host : u.host + ':' + u.port);
    rq.set (http::field::user_agent, traits_.user_agent);

    if (st.offset != 0)
      rq.set (http::field::range,
              "bytes=" + std::to_string (st.offset) + '-');

    // Only the store host gets to see the token, not whatever CDN it
    // redirects us to.
    //
    if (token_ && u.host == st.auth_host)
    {
      std::string t (token_ ());
      if (!t.empty ())
        rq.set (http::field::authorization, "Bearer " + t);
    }

    std::unique_ptr<transfer_connection> conn;
    auto p (std::make_unique<transfer_parser> ());
    p->body_limit ((std::numeric_limits<std::uint64_t>::max) ());
    beast::flat_buffer buf;

    // Send the request and read the response header. The same steps for
    // both stream flavors, each bounded by the idle timeout.
    //
    auto exchange = [&rq, &p, &buf, &st] (auto& s) -> asio::awaitable<void>
    {
      auto& l (beast::get_lowest_layer (s));

      l.expires_after (st.idle);
      co_await http::async_write (s, rq, asio::use_awaitable);

      l.expires_after (st.idle);
      co_await http::async_read_header (s, buf, *p, asio::use_awaitable);
    };

    try
    {
      tcp::resolver r (ioc_);
      auto addrs (co_await resolve_host (r, u.host, u.port, st.idle));

      if (tls)
      {
        using stream = beast::ssl_stream<beast::tcp_stream>;

        auto c (std::make_unique<basic_transfer_connection<stream>> (ioc_,
                                                                     ssl_));
        stream& s (c->stream ());

        // Without SNI most CDNs pick the wrong certificate or refuse the
        // handshake outright.
        //
        if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
        {
          boost::system::error_code ec (static_cast<int> (::ERR_get_error ()),
                                        asio::error::get_ssl_category ());
          throw boost::system::system_error (ec, "unable to set SNI hostname");
        }

        if (traits_.verify_ssl)
          s.set_verify_callback (ssl::rfc2818_verification (u.host));

        auto& l (beast::get_lowest_layer (s));

        l.expires_after (st.idle);
        co_await l.async_connect (addrs, asio::use_awaitable);

        l.expires_after (st.idle);
        co_await s.async_handshake (ssl::stream_base::client,
                                    asio::use_awaitable);

        co_await exchange (s);
        conn = std::move (c);
      }
      else
      {
        using stream = beast::tcp_stream;

        auto c (std::make_unique<basic_transfer_connection<stream>> (ioc_));
        stream& s (c->stream ());

        s.expires_after (st.idle);
        co_await s.async_connect (addrs, asio::use_awaitable);

        co_await exchange (s);
        conn = std::move (c);
      }
    }
    catch (const boost::system::system_error& e)
    {
      if (e.code () == beast::error::timeout)
        throw timeout_error ("no data received from " + u.host +
                             " within idle timeout");

      throw transport_error (u.host + ": " + e.code ().message ());
    }

    unsigned status (p->get ().result_int ());

    // Follow redirects.
    //
    if (status >= 300 && status < 400)
    {
      auto loc (p->get ()[http::field::location]);

      if (!loc.empty ())
      {
        std::string next (
          resolve_location (u, std::string (loc.data (), loc.size ())));
        conn->close ();

        co_return co_await open (std::move (next), st, redirects + 1);
      }
    }

    if (st.offset != 0 ? status != 206 : status != 200)
    {
      conn->close ();

      // A server that ignores the range would hand us the file from the
      // beginning, which we would then append to what we already have.
      //
      if (st.offset != 0 && status == 200)
        throw transport_error ("server ignored range request for " + url);

      throw transport_error ("unexpected HTTP status " +
                             std::to_string (status) + " for " + url);
    }

    std::uint64_t total (0);

    if (st.offset != 0)
    {
      auto v (p->get ()[http::field::content_range]);
      std::string cr (v.data (), v.size ());

      if (std::optional<std::uint64_t> f = content_range_first (cr))
      {
        if (*f != st.offset)
        {
          conn->close ();
          throw transport_error ("server resumed at byte " +
                                 std::to_string (*f) + " instead of " +
                                 std::to_string (st.offset) + " for " + url);
        }
      }

      if (std::optional<std::uint64_t> t = content_range_total (cr))
        total = *t;
    }

    if (total == 0)
    {
      if (auto cl = p->content_length ())
        total = *cl + st.offset;
    }

    if (st.progress)
      st.progress (st.offset, total);

    co_return stream_type (std::move (conn),
                           std::move (p),
                           std::move (buf),
                           st.offset,
                           total,
                           st.idle,
                           st.progress,
                           traits_.chunk_size);
  }

  template <typename R>
  asio::awaitable<typename R::results_type>
  resolve_host (R& r,
                std::string host,
                std::string port,
                std::chrono::steady_clock::duration idle)
  {
    // The timer handler may still be queued after we are done, so it only
    // touches the shared state and only cancels a resolver that is still
    // ours.
    //
    struct deadline_state
    {
      R* resolver;
      bool expired = false;
    };

    auto ds (std::make_shared<deadline_state> ());
    ds->resolver = &r;

    asio::steady_timer t (co_await asio::this_coro::executor, idle);
    t.async_wait ([ds] (const boost::system::error_code& ec)
                  {
                    if (!ec && ds->resolver != nullptr)
                    {
                      ds->expired = true;
                      ds->resolver->cancel ();
                    }
                  });

    boost::system::error_code ec;
    auto rs (co_await r.async_resolve (
               host, port, asio::redirect_error (asio::use_awaitable, ec)));

    ds->resolver = nullptr;
    t.cancel ();

    if (ec == asio::error::operation_aborted && ds->expired)
      throw timeout_error ("unable to resolve " + host +
                           " within idle timeout");

    if (ec)
      throw boost::system::system_error (ec);

    co_return rs;
  }
}
