#include <gogsync/transfer/transfer-types.hxx>

using namespace std;

namespace gogsync
{
  bool url_parts::
  default_port () const
  {
    return port == (scheme == "https" ? "443" : "80");
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Scheme.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // Authority ends at the start of the path, query or fragment.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.scheme == "https" ? "443" : "80";
    }

    // The fragment is client-side only and never goes on the wire.
    //
    size_t last (url.find ('#', end));
    if (last == string::npos)
      last = url.size ();

    if (end < last)
    {
      r.target = url.substr (end, last - end);

      if (r.target[0] != '/')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const url_parts& b, const string& l)
  {
    // Absolute.
    //
    if (l.find ("://") != string::npos)
      return l;

    string r (b.scheme + "://" + b.host);
    if (!b.default_port ())
      r += ':' + b.port;

    // Scheme-relative.
    //
    if (l.compare (0, 2, "//") == 0)
      return b.scheme + ':' + l;

    // Absolute path.
    //
    if (!l.empty () && l[0] == '/')
      return r + l;

    // Relative path: replace the last segment of the base path.
    //
    string d (b.target.substr (0, b.target.find_first_of ("?#")));
    d.erase (d.rfind ('/') + 1);

    return r + d + l;
  }
}
