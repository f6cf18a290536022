#include <gogsync/catalog/catalog-json.hxx>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/json/parse.hpp>
#include <boost/json/value_to.hpp>

using namespace std;

namespace gogsync
{
  static const json::object&
  as_object (const json::value& v, const char* what)
  {
    if (!v.is_object ())
      throw invalid_argument (string (what) + " must be an object");

    return v.as_object ();
  }

  static string
  string_member (const json::object& o, const char* n)
  {
    auto i (o.find (n));
    if (i == o.end () || !i->value ().is_string ())
      throw invalid_argument (string ("missing or non-string '") + n + "'");

    return json::value_to<string> (i->value ());
  }

  static optional<string>
  optional_string_member (const json::object& o, const char* n)
  {
    auto i (o.find (n));
    if (i == o.end () || i->value ().is_null ())
      return nullopt;

    if (!i->value ().is_string ())
      throw invalid_argument (string ("non-string '") + n + "'");

    string s (json::value_to<string> (i->value ()));
    if (s.empty ())
      return nullopt;

    return s;
  }

  static uint64_t
  unsigned_member (const json::object& o, const char* n)
  {
    auto i (o.find (n));
    if (i == o.end ())
      throw invalid_argument (string ("missing '") + n + "'");

    const json::value& v (i->value ());

    if (v.is_uint64 ())
      return v.as_uint64 ();

    if (v.is_int64 () && v.as_int64 () >= 0)
      return static_cast<uint64_t> (v.as_int64 ());

    throw invalid_argument (string ("'") + n +
                            "' must be a non-negative integer");
  }

  download_descriptor
  parse_download (const json::value& v)
  {
    const json::object& o (as_object (v, "download"));

    download_descriptor r;
    r.name = string_member (o, "name");
    r.language = string_member (o, "language");
    r.platform = to_platform (string_member (o, "platform"));
    r.url = string_member (o, "url");
    r.size = unsigned_member (o, "size");
    r.md5 = optional_string_member (o, "md5");
    r.filename = optional_string_member (o, "filename");

    return r;
  }

  game_entry
  parse_game (const json::value& v)
  {
    const json::object& o (as_object (v, "game"));

    game_entry r;
    r.id = unsigned_member (o, "id");
    r.title = string_member (o, "title");

    // A game without downloads (e.g., a pre-order) is valid.
    //
    auto i (o.find ("downloads"));
    if (i != o.end () && !i->value ().is_null ())
    {
      if (!i->value ().is_array ())
        throw invalid_argument ("'downloads' must be an array");

      for (const json::value& d: i->value ().as_array ())
        r.downloads.push_back (parse_download (d));
    }

    return r;
  }

  json_catalog::
  json_catalog (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open catalog " + f.string ());

    ostringstream os;
    os << ifs.rdbuf ();

    if (ifs.bad ())
      throw runtime_error ("unable to read catalog " + f.string ());

    init (os.str (), f.string ());
  }

  json_catalog::
  json_catalog (const string& text)
  {
    init (text, "<memory>");
  }

  void json_catalog::
  init (const string& text, const string& origin)
  {
    origin_ = origin;

    try
    {
      doc_ = json::parse (text);
    }
    catch (const exception& e)
    {
      throw runtime_error ("invalid catalog " + origin_ + ": " + e.what ());
    }

    if (doc_.is_array ())
      games_ = &doc_.as_array ();
    else if (doc_.is_object ())
    {
      const json::object& o (doc_.as_object ());

      auto i (o.find ("games"));
      if (i == o.end () || !i->value ().is_array ())
        throw runtime_error ("invalid catalog " + origin_ +
                             ": missing 'games' array");

      games_ = &i->value ().as_array ();
    }
    else
      throw runtime_error ("invalid catalog " + origin_ +
                           ": expected an object or an array");
  }

  optional<game_entry> json_catalog::
  next ()
  {
    if (pos_ == games_->size ())
      return nullopt;

    size_t i (pos_++);

    try
    {
      return parse_game ((*games_)[i]);
    }
    catch (const exception& e)
    {
      throw runtime_error ("invalid catalog " + origin_ + ": game #" +
                           std::to_string (i) + ": " + e.what ());
    }
  }

  size_t json_catalog::
  size () const noexcept
  {
    return games_->size ();
  }
}
