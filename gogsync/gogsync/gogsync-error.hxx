#pragma once

#include <string>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace gogsync
{
  namespace fs = std::filesystem;

  // Network failure while talking to the download server. Always retryable.
  //
  class transport_error: public std::runtime_error
  {
  public:
    explicit
    transport_error (const std::string& what)
      : std::runtime_error (what)
    {
    }
  };

  // No bytes arrived within the idle window.
  //
  class timeout_error: public transport_error
  {
  public:
    explicit
    timeout_error (const std::string& what)
      : transport_error (what)
    {
    }
  };

  // Local disk access failure.
  //
  class io_error: public std::runtime_error
  {
  public:
    io_error (const std::string& what,
              fs::path p,
              std::error_code ec = std::error_code ())
      : std::runtime_error (make_what (what, p, ec)),
        path (std::move (p)),
        code (ec)
    {
    }

    fs::path path;
    std::error_code code;

  private:
    static std::string
    make_what (const std::string& w, const fs::path& p, std::error_code ec)
    {
      std::string r (w + ": " + p.string ());
      if (ec)
        r += ": " + ec.message ();
      return r;
    }
  };

  // Thrown from inside a retried action to abandon the unit of work without
  // consuming further attempts.
  //
  class skip_signal: public std::runtime_error
  {
  public:
    explicit
    skip_signal (const std::string& reason)
      : std::runtime_error (reason)
    {
    }
  };

  // All attempts of a retried action failed.
  //
  class too_many_retries: public std::runtime_error
  {
  public:
    too_many_retries (std::size_t n, std::exception_ptr e, std::string m)
      : std::runtime_error ("giving up after " + std::to_string (n) +
                            (n == 1 ? " attempt: " : " attempts: ") + m),
        attempts (n),
        last_error (std::move (e)),
        last_message (std::move (m))
    {
    }

    std::size_t attempts;
    std::exception_ptr last_error;
    std::string last_message;
  };
}
