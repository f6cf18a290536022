#include <gogsync/transfer/transfer-engine.hxx>

#include <cassert>
#include <chrono>
#include <exception>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <gogsync/gogsync-error.hxx>

using namespace std;
using namespace gogsync;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

using tcp = asio::ip::tcp;

template <typename V>
static string
str (const V& v)
{
  return string (v.data (), v.size ());
}

static string
make_content (size_t n)
{
  string r;
  r.reserve (n);
  for (size_t i (0); i < n; ++i)
    r += static_cast<char> ('a' + (i * 7) % 26);
  return r;
}

// What the server saw.
//
struct seen_request
{
  string target;
  string range;
  string authorization;
};

// Loopback HTTP server with a handful of canned behaviors, selected by the
// request target.
//
class test_server
{
public:
  explicit
  test_server (asio::io_context& ioc, string content)
    : content_ (move (content)),
      acceptor_ (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0))
  {
    asio::co_spawn (ioc, accept_loop (), asio::detached);
  }

  string
  url (const string& path) const
  {
    return "http://127.0.0.1:" +
           to_string (acceptor_.local_endpoint ().port ()) + path;
  }

  void
  stop ()
  {
    boost::system::error_code ec;
    acceptor_.close (ec);
  }

  vector<seen_request> seen;

private:
  asio::awaitable<void>
  accept_loop ()
  {
    for (;;)
    {
      boost::system::error_code ec;
      tcp::socket s (co_await acceptor_.async_accept (
        asio::redirect_error (asio::use_awaitable, ec)));

      if (ec)
        co_return;

      asio::co_spawn (acceptor_.get_executor (),
                      session (move (s)),
                      asio::detached);
    }
  }

  asio::awaitable<void>
  session (tcp::socket s)
  {
    beast::flat_buffer b;
    http::request<http::string_body> rq;
    co_await http::async_read (s, b, rq, asio::use_awaitable);

    string t (str (rq.target ()));
    string range (str (rq[http::field::range]));

    seen.push_back (seen_request {t,
                                  range,
                                  str (rq[http::field::authorization])});

    // Headers, a little data, then nothing.
    //
    if (t == "/stall" || t == "/silent")
    {
      if (t == "/stall")
      {
        string h ("HTTP/1.1 200 OK\r\n"
                  "Content-Length: 100\r\n"
                  "\r\n"
                  "0123456789");

        co_await asio::async_write (s, asio::buffer (h), asio::use_awaitable);
      }

      asio::steady_timer tm (s.get_executor (), chrono::seconds (1));
      co_await tm.async_wait (asio::use_awaitable);
      co_return;
    }

    http::response<http::string_body> rs;
    rs.version (11);
    rs.keep_alive (false);

    if (t == "/file" || t == "/ignore-range")
    {
      size_t first (0);

      if (t == "/file" && range.compare (0, 6, "bytes=") == 0)
        first = static_cast<size_t> (stoull (range.substr (6)));

      if (first != 0)
      {
        rs.result (http::status::partial_content);
        rs.set (http::field::content_range,
                "bytes " + to_string (first) + '-' +
                to_string (content_.size () - 1) + '/' +
                to_string (content_.size ()));
      }
      else
        rs.result (http::status::ok);

      rs.body () = content_.substr (first);
    }
    else if (t == "/redirect")
    {
      rs.result (http::status::found);
      rs.set (http::field::location, "/file");
    }
    else if (t == "/auth")
    {
      rs.result (http::status::ok);
      rs.body () = str (rq[http::field::authorization]);
    }
    else
      rs.result (http::status::not_found);

    rs.prepare_payload ();
    co_await http::async_write (s, rs, asio::use_awaitable);

    boost::system::error_code ec;
    s.shutdown (tcp::socket::shutdown_send, ec);
  }

  string content_;
  tcp::acceptor acceptor_;
};

using progress_log = vector<pair<uint64_t, uint64_t>>;

static transfer_traits<>
small_chunks ()
{
  transfer_traits<> t;
  t.chunk_size = 4096;
  return t;
}

static download_descriptor
descriptor (const string& url, uint64_t size)
{
  download_descriptor d;
  d.name = "setup";
  d.language = "English";
  d.url = url;
  d.size = size;
  return d;
}

static asio::awaitable<string>
drain (transfer_stream& s)
{
  string r;
  transfer_chunk c;

  while (co_await s.next (c))
  {
    assert (!c.empty ());
    assert (c.size () <= 4096);
    r.append (c.data (), c.size ());
  }

  assert (c.empty ());
  co_return r;
}

// Run the client coroutine against a fresh server.
//
template <typename F>
static void
with_server (const string& content, F client, token_provider token = nullptr)
{
  asio::io_context ioc;
  test_server srv (ioc, content);
  transfer_engine e (ioc, small_chunks (), move (token));

  exception_ptr ex;

  auto body = [&] () -> asio::awaitable<void>
  {
    co_await client (e, srv);
  };

  asio::co_spawn (ioc,
                  body (),
                  [&ex, &srv] (exception_ptr x)
                  {
                    ex = x;
                    srv.stop ();
                  });

  ioc.run ();

  if (ex)
    rethrow_exception (ex);
}

static void
test_full ()
{
  string content (make_content (200000));

  with_server (content, [&content] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    progress_log log;

    transfer_stream s (
      co_await e.download (descriptor (srv.url ("/file"), content.size ()),
                           [&log] (uint64_t c, uint64_t t)
                           {
                             log.emplace_back (c, t);
                           },
                           nullopt,
                           chrono::seconds (3)));

    assert (s.offset () == 0);
    assert (s.total () == content.size ());

    string r (co_await drain (s));

    assert (r == content);
    assert (s.received () == content.size ());
    assert (s.done ());

    // Headers first, then every chunk, never going backwards.
    //
    assert (log.size () > 2);
    assert (log.front () == make_pair (uint64_t (0),
                                       uint64_t (content.size ())));
    assert (log.back () == make_pair (uint64_t (content.size ()),
                                      uint64_t (content.size ())));

    for (size_t i (1); i < log.size (); ++i)
      assert (log[i].first >= log[i - 1].first);

    assert (srv.seen.size () == 1);
    assert (srv.seen[0].range.empty ());
  });
}

// Resume: the request starts exactly at the offset and the totals describe
// the whole file.
//
static void
test_resume ()
{
  string content (make_content (200000));

  with_server (content, [&content] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    progress_log log;

    transfer_stream s (
      co_await e.download (descriptor (srv.url ("/file"), content.size ()),
                           [&log] (uint64_t c, uint64_t t)
                           {
                             log.emplace_back (c, t);
                           },
                           150000,
                           chrono::seconds (3)));

    assert (s.offset () == 150000);
    assert (s.total () == content.size ());

    string r (co_await drain (s));

    assert (r == content.substr (150000));
    assert (s.received () == content.size () - 150000);

    assert (log.front () == make_pair (uint64_t (150000),
                                       uint64_t (content.size ())));
    assert (log.back ().first == content.size ());

    assert (srv.seen.size () == 1);
    assert (srv.seen[0].range == "bytes=150000-");
  });
}

// An offset of zero is a plain request.
//
static void
test_zero_offset ()
{
  string content (make_content (1000));

  with_server (content, [&content] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    transfer_stream s (
      co_await e.download (descriptor (srv.url ("/file"), content.size ()),
                           nullptr,
                           0,
                           chrono::seconds (3)));

    assert ((co_await drain (s)) == content);
    assert (srv.seen[0].range.empty ());
  });
}

// A fragment in the store URL never reaches the server.
//
static void
test_fragment ()
{
  string content (make_content (1000));

  with_server (content, [&content] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    transfer_stream s (
      co_await e.download (descriptor (srv.url ("/file#part"),
                                       content.size ()),
                           nullptr,
                           nullopt,
                           chrono::seconds (3)));

    assert ((co_await drain (s)) == content);
    assert (srv.seen.size () == 1);
    assert (srv.seen[0].target == "/file");
  });
}

// The range survives a redirect.
//
static void
test_redirect ()
{
  string content (make_content (5000));

  with_server (content, [&content] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    transfer_stream s (
      co_await e.download (descriptor (srv.url ("/redirect"), content.size ()),
                           nullptr,
                           10,
                           chrono::seconds (3)));

    assert ((co_await drain (s)) == content.substr (10));

    assert (srv.seen.size () == 2);
    assert (srv.seen[0].target == "/redirect");
    assert (srv.seen[1].target == "/file");
    assert (srv.seen[0].range == "bytes=10-");
    assert (srv.seen[1].range == "bytes=10-");
  });
}

static void
test_status ()
{
  string content (make_content (100));

  // Range ignored by the server.
  //
  with_server (content, [] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    bool thrown (false);
    try
    {
      co_await e.download (descriptor (srv.url ("/ignore-range"), 100),
                           nullptr,
                           5,
                           chrono::seconds (3));
    }
    catch (const transport_error& x)
    {
      thrown = true;
      assert (string (x.what ()).find ("ignored range") != string::npos);
    }
    assert (thrown);
  });

  // Not found.
  //
  with_server (content, [] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    bool thrown (false);
    try
    {
      co_await e.download (descriptor (srv.url ("/nowhere"), 100),
                           nullptr,
                           nullopt,
                           chrono::seconds (3));
    }
    catch (const timeout_error&)
    {
      assert (false);
    }
    catch (const transport_error& x)
    {
      thrown = true;
      assert (string (x.what ()).find ("404") != string::npos);
    }
    assert (thrown);
  });
}

// Idle timeout, both mid-body and while waiting for the headers.
//
static void
test_timeout ()
{
  with_server ("", [] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    transfer_stream s (
      co_await e.download (descriptor (srv.url ("/stall"), 100),
                           nullptr,
                           nullopt,
                           chrono::milliseconds (200)));

    assert (s.total () == 100);

    transfer_chunk c;
    assert (co_await s.next (c));
    assert (string (c.data (), c.size ()) == "0123456789");

    bool thrown (false);
    try
    {
      co_await s.next (c);
    }
    catch (const timeout_error&)
    {
      thrown = true;
    }
    assert (thrown);
    assert (s.done ());

    // The stream is closed, nothing more comes out.
    //
    assert (!(co_await s.next (c)));
  });

  with_server ("", [] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
  {
    auto start (chrono::steady_clock::now ());

    bool thrown (false);
    try
    {
      co_await e.download (descriptor (srv.url ("/silent"), 100),
                           nullptr,
                           nullopt,
                           chrono::milliseconds (200));
    }
    catch (const timeout_error&)
    {
      thrown = true;
    }
    assert (thrown);
    assert (chrono::steady_clock::now () - start < chrono::seconds (1));
  });
}

// Resolver that never answers until cancelled.
//
class stalled_resolver
{
public:
  using results_type = tcp::resolver::results_type;

  explicit
  stalled_resolver (asio::io_context& ioc)
    : timer_ (ioc, chrono::hours (1)) {}

  template <typename T>
  auto
  async_resolve (const string&, const string&, T&& token)
  {
    using signature = void (boost::system::error_code, results_type);

    return asio::async_initiate<T, signature> (
      [this] (auto h)
      {
        timer_.async_wait (
          [h = move (h)] (const boost::system::error_code&) mutable
          {
            move (h) (boost::system::error_code (asio::error::operation_aborted),
                      results_type ());
          });
      },
      token);
  }

  void
  cancel ()
  {
    timer_.cancel ();
  }

private:
  asio::steady_timer timer_;
};

// Name resolution is bounded by the idle timeout too.
//
static void
test_resolve_timeout ()
{
  asio::io_context ioc;
  exception_ptr ex;
  bool thrown (false);

  auto start (chrono::steady_clock::now ());

  asio::co_spawn (
    ioc,
    [&ioc, &thrown] () -> asio::awaitable<void>
    {
      stalled_resolver r (ioc);

      try
      {
        co_await resolve_host (r,
                               "cdn.example.org",
                               "443",
                               chrono::milliseconds (100));
      }
      catch (const timeout_error&)
      {
        thrown = true;
      }
    },
    [&ex] (exception_ptr e) {ex = e;});

  ioc.run ();

  if (ex)
    rethrow_exception (ex);

  assert (thrown);
  assert (chrono::steady_clock::now () - start < chrono::seconds (1));

  // A resolver that does answer is not held up by the deadline.
  //
  asio::io_context ioc2;
  bool resolved (false);

  start = chrono::steady_clock::now ();

  asio::co_spawn (
    ioc2,
    [&ioc2, &resolved] () -> asio::awaitable<void>
    {
      tcp::resolver r (ioc2);
      auto rs (co_await resolve_host (r,
                                      "127.0.0.1",
                                      "80",
                                      chrono::seconds (5)));
      resolved = !rs.empty ();
    },
    [&ex] (exception_ptr e) {ex = e;});

  ioc2.run ();

  if (ex)
    rethrow_exception (ex);

  assert (resolved);
  assert (chrono::steady_clock::now () - start < chrono::seconds (3));
}

// The bearer token goes to the descriptor's host.
//
static void
test_token ()
{
  with_server ("",
               [] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
               {
                 transfer_stream s (
                   co_await e.download (descriptor (srv.url ("/auth"), 0),
                                        nullptr,
                                        nullopt,
                                        chrono::seconds (3)));

                 assert ((co_await drain (s)) == "Bearer secret");
               },
               [] () {return string ("secret");});

  with_server ("",
               [] (transfer_engine& e, test_server& srv)
               -> asio::awaitable<void>
               {
                 transfer_stream s (
                   co_await e.download (descriptor (srv.url ("/auth"), 0),
                                        nullptr,
                                        nullopt,
                                        chrono::seconds (3)));

                 assert ((co_await drain (s)).empty ());
                 assert (srv.seen[0].authorization.empty ());
               },
               [] () {return string ();});
}

static void
test_url ()
{
  {
    url_parts u (parse_url ("https://cdn.example.org/a/b/setup.exe?t=1"));
    assert (u.scheme == "https");
    assert (u.host == "cdn.example.org");
    assert (u.port == "443");
    assert (u.default_port ());
    assert (u.target == "/a/b/setup.exe?t=1");
  }

  {
    url_parts u (parse_url ("http://127.0.0.1:8080"));
    assert (u.host == "127.0.0.1");
    assert (u.port == "8080");
    assert (!u.default_port ());
    assert (u.target == "/");
  }

  {
    url_parts u (parse_url ("example.org?x=1"));
    assert (u.scheme == "http");
    assert (u.host == "example.org");
    assert (u.target == "/?x=1");
  }

  // The fragment is dropped, the query is kept.
  //
  {
    url_parts u (parse_url ("https://h/a/setup.exe?t=1#part"));
    assert (u.target == "/a/setup.exe?t=1");
    assert (parse_url ("http://h/a#x").target == "/a");
    assert (parse_url ("example.org#frag").target == "/");
    assert (parse_url ("http://h:81#f").port == "81");
  }

  url_parts b (parse_url ("http://h:81/dir/file?q"));
  assert (resolve_location (b, "https://o/x") == "https://o/x");
  assert (resolve_location (b, "//o/x") == "http://o/x");
  assert (resolve_location (b, "/x") == "http://h:81/x");
  assert (resolve_location (b, "y") == "http://h:81/dir/y");
}

static void
test_content_range ()
{
  assert (content_range_total ("bytes 100-199/200") == 200u);
  assert (content_range_first ("bytes 100-199/200") == 100u);
  assert (!content_range_total ("bytes 100-199/*"));
  assert (!content_range_total (""));
  assert (!content_range_first ("items 1-2/3"));
}

int
main ()
{
  test_url ();
  test_content_range ();
  test_full ();
  test_resume ();
  test_zero_offset ();
  test_fragment ();
  test_redirect ();
  test_status ();
  test_timeout ();
  test_resolve_timeout ();
  test_token ();
}
