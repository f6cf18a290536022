#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <gogsync/gogsync-error.hxx>

namespace gogsync
{
  namespace asio = boost::asio;

  // Called before each delay with the number of the attempt that just
  // failed and its error message.
  //
  using retry_callback = std::function<void (std::size_t, const std::string&)>;

  // Value type produced by a retried action.
  //
  template <typename F>
  using retry_value_type =
    typename std::invoke_result_t<F&>::value_type;

  // Invoke the action (a callable returning asio::awaitable<T>) up to
  // attempts times, waiting delay between two attempts. The first attempt
  // that returns is the result, whatever that result means to the caller.
  //
  // Any std::exception other than skip_signal counts as a failed attempt.
  // skip_signal propagates immediately. After the last failed attempt,
  // too_many_retries is thrown carrying the last error.
  //
  // Attempts never overlap: the delay suspends the calling coroutine.
  //
  template <typename F>
  asio::awaitable<retry_value_type<F>>
  retry (F action,
         std::size_t attempts,
         std::chrono::steady_clock::duration delay,
         retry_callback on_retry = nullptr);
}

#include <gogsync/retry/retry.txx>
