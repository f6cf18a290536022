#include <gogsync/sync/sync-filter.hxx>

#include <algorithm>

using namespace std;

namespace gogsync
{
  string
  sanitize_title (const string& t)
  {
    string r;
    r.reserve (t.size ());

    for (char c: t)
    {
      bool ok ((c >= 'a' && c <= 'z') ||
               (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-');

      char o (ok ? c : '_');

      if (o == '_' && !r.empty () && r.back () == '_')
        continue;

      r += o;
    }

    return r;
  }

  fs::path
  target_directory (const fs::path& base, const game_entry& g)
  {
    string t (sanitize_title (g.title));

    if (t.empty ())
      t = std::to_string (g.id);

    return base / t;
  }

  // Last segment of the URL path, without query and fragment.
  //
  static string
  url_filename (const string& u)
  {
    string p (u);

    size_t q (p.find_first_of ("?#"));
    if (q != string::npos)
      p.resize (q);

    size_t s (p.find ("://"));
    if (s != string::npos)
    {
      size_t b (p.find ('/', s + 3));
      p = b != string::npos ? p.substr (b) : string ();
    }

    size_t l (p.rfind ('/'));
    return l != string::npos ? p.substr (l + 1) : p;
  }

  string
  target_filename (const download_descriptor& d)
  {
    string r;

    if (d.filename && !d.filename->empty ())
      r = *d.filename;
    else
      r = url_filename (d.url);

    if (r.empty () || r == "." || r == "..")
      r = d.name;

    replace (r.begin (), r.end (), '/', '_');
    replace (r.begin (), r.end (), '\\', '_');

    if (r.empty () || r == "." || r == "..")
      r = "download";

    return r;
  }

  vector<size_t>
  resolve_downloads (const game_entry& g, const sync_options& o)
  {
    const vector<download_descriptor>& ds (g.downloads);

    auto select = [&ds] (const string& l)
    {
      vector<size_t> r;
      for (size_t i (0); i != ds.size (); ++i)
        if (ds[i].language == l)
          r.push_back (i);
      return r;
    };

    if (o.english_fallback && o.language)
    {
      vector<size_t> r (select (*o.language));

      if (r.empty ())
        r = select (english_language);

      return r;
    }

    vector<size_t> r (ds.size ());
    for (size_t i (0); i != r.size (); ++i)
      r[i] = i;

    return r;
  }

  bool
  excluded (const game_entry& g,
            const vector<size_t>& resolved,
            const sync_options& o)
  {
    if (!o.exclude_language)
      return false;

    return any_of (resolved.begin (),
                   resolved.end (),
                   [&g, &o] (size_t i)
                   {
                     return g.downloads[i].language == *o.exclude_language;
                   });
  }

  optional<skip_reason>
  filter (const download_descriptor& d, const sync_options& o)
  {
    if (o.operating_system && d.platform != *o.operating_system)
      return skip_reason::os_filter;

    if (o.language &&
        d.language != *o.language &&
        (!o.english_fallback || d.language != english_language))
      return skip_reason::language_filter;

    return nullopt;
  }

  vector<optional<skip_reason>>
  plan_game (const game_entry& g, const sync_options& o)
  {
    vector<size_t> rs (resolve_downloads (g, o));

    if (excluded (g, rs, o))
      return vector<optional<skip_reason>> (g.downloads.size (),
                                            skip_reason::excluded_language);

    // Whatever resolution dropped is out for language reasons.
    //
    vector<optional<skip_reason>> r (g.downloads.size (),
                                     skip_reason::language_filter);

    for (size_t i: rs)
      r[i] = filter (g.downloads[i], o);

    return r;
  }
}
