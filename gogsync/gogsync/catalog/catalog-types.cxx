#include <gogsync/catalog/catalog-types.hxx>

#include <stdexcept>

using namespace std;

namespace gogsync
{
  string
  to_string (platform p)
  {
    switch (p)
    {
      case platform::windows: return "windows";
      case platform::mac:     return "mac";
      case platform::linux_:  return "linux";
    }
    return "windows";
  }

  optional<platform>
  parse_platform (const string& s)
  {
    if (s == "windows") return platform::windows;
    if (s == "mac")     return platform::mac;
    if (s == "linux")   return platform::linux_;

    return nullopt;
  }

  platform
  to_platform (const string& s)
  {
    if (optional<platform> p = parse_platform (s))
      return *p;

    throw invalid_argument ("invalid platform '" + s + "'");
  }

  string download_descriptor::
  label () const
  {
    return name + " (" + to_string (platform) + ", " + language + ")";
  }
}
