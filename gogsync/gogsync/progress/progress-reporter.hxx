#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <ostream>

namespace gogsync
{
  // Single-line progress display for the file being transferred:
  //
  //  <current> / <total> [<bar>] <pct>% - <message>
  //
  // The line is redrawn in place with a carriage return, at most once per
  // redraw interval, and ended with a newline by finish() or abandon().
  //
  class progress_reporter
  {
  public:
    static constexpr std::size_t default_bar_width = 28;
    static constexpr std::chrono::milliseconds redraw_interval {100};

    // If raw_bytes is true, counters are shown unscaled.
    //
    explicit
    progress_reporter (std::ostream&,
                       bool raw_bytes = false,
                       std::size_t bar_width = default_bar_width);

    progress_reporter (const progress_reporter&) = delete;
    progress_reporter& operator= (const progress_reporter&) = delete;

    // Begin a new line for the file described by message.
    //
    void
    start (std::string message);

    // Update the counters. A total of 0 leaves the previous total in place.
    //
    void
    update (std::uint64_t current, std::uint64_t total);

    // Draw the line as complete and end it. If the total was never known,
    // the current count becomes the total.
    //
    void
    finish ();

    // End the line as it is (the transfer failed).
    //
    void
    abandon ();

    bool
    active () const noexcept
    {
      return active_;
    }

    // Current line content, without the carriage return.
    //
    std::string
    line () const;

  private:
    void
    draw ();

  private:
    std::ostream& os_;
    bool raw_;
    std::size_t width_;

    bool active_ {false};
    std::string message_;
    std::uint64_t current_ {0};
    std::uint64_t total_ {0};
    std::chrono::steady_clock::time_point drawn_;
    std::size_t drawn_size_ {0};
  };
}
