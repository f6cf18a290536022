#include <gogsync/transfer/transfer-engine.hxx>

#include <cctype>

using namespace std;

namespace gogsync
{
  // Explicit template instantiations.
  //
  template class basic_transfer_stream<transfer_traits<>>;
  template class basic_transfer_engine<transfer_traits<>>;

  static optional<uint64_t>
  parse_position (const string& s, size_t b, size_t e)
  {
    if (b >= e)
      return nullopt;

    uint64_t r (0);
    for (size_t i (b); i != e; ++i)
    {
      if (!isdigit (static_cast<unsigned char> (s[i])))
        return nullopt;

      r = r * 10 + static_cast<uint64_t> (s[i] - '0');
    }

    return r;
  }

  // Content-Range: bytes <first>-<last>/<complete-length>
  //
  optional<uint64_t>
  content_range_total (const string& v)
  {
    size_t s (v.rfind ('/'));
    if (s == string::npos)
      return nullopt;

    return parse_position (v, s + 1, v.size ());
  }

  optional<uint64_t>
  content_range_first (const string& v)
  {
    size_t b (v.find ("bytes "));
    if (b == string::npos)
      return nullopt;

    b += 6;

    size_t e (v.find ('-', b));
    if (e == string::npos)
      return nullopt;

    return parse_position (v, b, e);
  }
}
