#include <gogsync/retry/retry.hxx>

#include <cassert>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

using namespace std;
using namespace gogsync;

namespace asio = boost::asio;

// Run a coroutine to completion and hand back its result (or rethrow its
// exception).
//
template <typename T>
static T
run (asio::awaitable<T> a)
{
  asio::io_context ioc;

  T r {};
  exception_ptr ex;

  asio::co_spawn (ioc,
                  std::move (a),
                  [&r, &ex] (exception_ptr e, T v)
                  {
                    ex = e;
                    if (!e)
                      r = std::move (v);
                  });

  ioc.run ();

  if (ex)
    rethrow_exception (ex);

  return r;
}

// First attempt wins, no delay is spent.
//
static void
test_success ()
{
  size_t calls (0);

  auto start (chrono::steady_clock::now ());

  int r (run (retry ([&calls] () -> asio::awaitable<int>
                     {
                       ++calls;
                       co_return 42;
                     },
                     3,
                     chrono::seconds (5))));

  assert (r == 42);
  assert (calls == 1);
  assert (chrono::steady_clock::now () - start < chrono::seconds (5));
}

// Two failures, then success on the third and last attempt.
//
static void
test_recover ()
{
  size_t calls (0);
  vector<size_t> notified;

  int r (run (retry ([&calls] () -> asio::awaitable<int>
                     {
                       if (++calls < 3)
                         throw runtime_error ("flaky");
                       co_return 7;
                     },
                     3,
                     chrono::milliseconds (1),
                     [&notified] (size_t n, const string& m)
                     {
                       assert (m == "flaky");
                       notified.push_back (n);
                     })));

  assert (r == 7);
  assert (calls == 3);
  assert ((notified == vector<size_t> {1, 2}));
}

// Every attempt fails: exactly attempts calls, then too_many_retries with
// the last error inside.
//
static void
test_exhausted ()
{
  size_t calls (0);
  bool thrown (false);

  auto start (chrono::steady_clock::now ());

  try
  {
    run (retry ([&calls] () -> asio::awaitable<int>
                {
                  ++calls;
                  throw runtime_error ("attempt " + to_string (calls));
                  co_return 0;
                },
                3,
                chrono::milliseconds (20)));
  }
  catch (const too_many_retries& e)
  {
    thrown = true;

    assert (e.attempts == 3);
    assert (e.last_message == "attempt 3");
    assert (e.last_error != nullptr);

    try
    {
      rethrow_exception (e.last_error);
    }
    catch (const runtime_error& le)
    {
      assert (string (le.what ()) == "attempt 3");
    }
  }

  assert (thrown);
  assert (calls == 3);

  // Two delays between three attempts.
  //
  assert (chrono::steady_clock::now () - start >= chrono::milliseconds (40));
}

// A single attempt means no retry at all.
//
static void
test_single ()
{
  size_t calls (0);
  bool thrown (false);

  try
  {
    run (retry ([&calls] () -> asio::awaitable<int>
                {
                  ++calls;
                  throw runtime_error ("nope");
                  co_return 0;
                },
                1,
                chrono::seconds (10)));
  }
  catch (const too_many_retries& e)
  {
    thrown = true;
    assert (e.attempts == 1);
  }

  assert (thrown);
  assert (calls == 1);
}

// skip_signal is not a failure: it is neither retried nor converted.
//
static void
test_skip ()
{
  size_t calls (0);
  bool thrown (false);

  try
  {
    run (retry ([&calls] () -> asio::awaitable<int>
                {
                  ++calls;
                  throw skip_signal ("not wanted");
                  co_return 0;
                },
                3,
                chrono::milliseconds (1)));
  }
  catch (const skip_signal& e)
  {
    thrown = true;
    assert (string (e.what ()) == "not wanted");
  }

  assert (thrown);
  assert (calls == 1);
}

// Void actions.
//
static void
test_void ()
{
  size_t calls (0);

  run ([&calls] () -> asio::awaitable<int>
  {
    co_await retry ([&calls] () -> asio::awaitable<void>
                    {
                      if (++calls == 1)
                        throw runtime_error ("once");
                      co_return;
                    },
                    2,
                    chrono::milliseconds (1));
    co_return 0;
  } ());

  assert (calls == 2);
}

static void
test_zero ()
{
  bool thrown (false);

  try
  {
    run (retry ([] () -> asio::awaitable<int> { co_return 1; },
                0,
                chrono::milliseconds (1)));
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }

  assert (thrown);
}

int
main ()
{
  test_success ();
  test_recover ();
  test_exhausted ();
  test_single ();
  test_skip ();
  test_void ();
  test_zero ();
}
