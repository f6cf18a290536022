#include <gogsync/progress/progress-format.hxx>

#include <iomanip>
#include <sstream>

using namespace std;

namespace gogsync
{
  string
  format_bytes (uint64_t n, bool raw)
  {
    double v (static_cast<double> (n));
    const char* u ("B");

    if (!raw)
    {
      if (n > (uint64_t (1) << 30))
      {
        v /= 1024.0 * 1024.0 * 1024.0;
        u = "GB";
      }
      else if (n > (uint64_t (1) << 20))
      {
        v /= 1024.0 * 1024.0;
        u = "MB";
      }
      else if (n > (uint64_t (1) << 10))
      {
        v /= 1024.0;
        u = "kB";
      }
    }

    ostringstream o;
    o << fixed << setprecision (2) << v;

    // Group the integer part in thousands.
    //
    string s (o.str ());
    for (size_t i (s.find ('.')); i > 3; i -= 3)
      s.insert (i - 3, 1, ',');

    return s + ' ' + u;
  }

  string
  format_bar (double r, size_t w)
  {
    if (r < 0.0)
      r = 0.0;
    else if (r > 1.0)
      r = 1.0;

    size_t f (static_cast<size_t> (r * static_cast<double> (w)));

    string s;
    s.reserve (w + 2);
    s += '[';

    for (size_t i (0); i < w; ++i)
    {
      if (i + 1 < f || f == w)
        s += '=';
      else if (i + 1 == f)
        s += '>';
      else
        s += ' ';
    }

    s += ']';
    return s;
  }

  string
  format_percent (uint64_t c, uint64_t t)
  {
    uint64_t p (0);

    if (t != 0)
      p = c >= t ? 100 : static_cast<uint64_t> (
        static_cast<double> (c) * 100.0 / static_cast<double> (t));

    ostringstream o;
    o << setw (3) << p << '%';
    return o.str ();
  }
}
