#include <exception>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace gogsync
{
  template <typename F>
  asio::awaitable<retry_value_type<F>>
  retry (F action,
         std::size_t attempts,
         std::chrono::steady_clock::duration delay,
         retry_callback on_retry)
  {
    using value_type = retry_value_type<F>;

    if (attempts == 0)
      throw std::invalid_argument ("retry: at least one attempt is required");

    std::exception_ptr last;
    std::string message;

    for (std::size_t i (1);; ++i)
    {
      try
      {
        if constexpr (std::is_void_v<value_type>)
        {
          co_await action ();
          co_return;
        }
        else
          co_return co_await action ();
      }
      catch (const skip_signal&)
      {
        throw;
      }
      catch (const std::exception& e)
      {
        last = std::current_exception ();
        message = e.what ();
      }

      if (i == attempts)
        break;

      if (on_retry)
        on_retry (i, message);

      // Note that we cannot co_await inside the handler above, hence the
      // wait out here.
      //
      asio::steady_timer t (co_await asio::this_coro::executor, delay);
      co_await t.async_wait (asio::use_awaitable);
    }

    throw too_many_retries (attempts, std::move (last), std::move (message));
  }
}
