#include <gogsync/progress/progress-reporter.hxx>

#include <gogsync/progress/progress-format.hxx>

using namespace std;

namespace gogsync
{
  progress_reporter::
  progress_reporter (ostream& os, bool raw, size_t w)
    : os_ (os), raw_ (raw), width_ (w)
  {
  }

  void progress_reporter::
  start (string m)
  {
    if (active_)
      abandon ();

    active_ = true;
    message_ = move (m);
    current_ = 0;
    total_ = 0;

    draw ();
  }

  void progress_reporter::
  update (uint64_t c, uint64_t t)
  {
    if (!active_)
      return;

    current_ = c;
    if (t != 0)
      total_ = t;

    // Always show the last update, the rest only as often as it is useful
    // to look at.
    //
    if ((total_ != 0 && current_ >= total_) ||
        chrono::steady_clock::now () - drawn_ >= redraw_interval)
      draw ();
  }

  void progress_reporter::
  finish ()
  {
    if (!active_)
      return;

    if (total_ == 0)
      total_ = current_;
    else
      current_ = total_;

    draw ();
    os_ << '\n';
    os_.flush ();

    active_ = false;
    drawn_size_ = 0;
  }

  void progress_reporter::
  abandon ()
  {
    if (!active_)
      return;

    draw ();
    os_ << '\n';
    os_.flush ();

    active_ = false;
    drawn_size_ = 0;
  }

  string progress_reporter::
  line () const
  {
    double r (total_ != 0
              ? static_cast<double> (current_) / static_cast<double> (total_)
              : 0.0);

    string s (1, ' ');
    s += format_bytes (current_, raw_);
    s += " / ";
    s += format_bytes (total_, raw_);
    s += ' ';
    s += format_bar (r, width_);
    s += ' ';
    s += format_percent (current_, total_);
    s += " - ";
    s += message_;
    return s;
  }

  void progress_reporter::
  draw ()
  {
    // Blank out whatever is left of a longer previous line.
    //
    string l (line ());
    size_t n (l.size ());

    if (n < drawn_size_)
      l.append (drawn_size_ - n, ' ');

    os_ << '\r' << l;
    os_.flush ();

    drawn_size_ = n;

    drawn_ = chrono::steady_clock::now ();
  }
}
