#include <gogsync/sync/sync-types.hxx>

#include <utility>

using namespace std;

namespace gogsync
{
  string
  to_string (skip_reason r)
  {
    switch (r)
    {
      case skip_reason::os_filter:          return "of OS filter";
      case skip_reason::language_filter:    return "of language filter";
      case skip_reason::excluded_language:  return "of excluded language";
      case skip_reason::existing_valid:     return "it exists and is valid";
      case skip_reason::existing_untrusted:
        return "it exists (--no-verify specified, not checking content)";
    }

    return string ();
  }

  string
  to_string (sync_status s)
  {
    switch (s)
    {
      case sync_status::completed: return "completed";
      case sync_status::skipped:   return "skipped";
      case sync_status::failed:    return "failed";
    }

    return string ();
  }

  sync_outcome sync_outcome::
  completed (uint64_t b, bool m)
  {
    sync_outcome r;
    r.status = sync_status::completed;
    r.bytes = b;
    r.hash_mismatch = m;
    return r;
  }

  sync_outcome sync_outcome::
  skipped (skip_reason s)
  {
    sync_outcome r;
    r.status = sync_status::skipped;
    r.reason = s;
    return r;
  }

  sync_outcome sync_outcome::
  failed (exception_ptr e, string m)
  {
    sync_outcome r;
    r.status = sync_status::failed;
    r.error = move (e);
    r.message = move (m);
    return r;
  }

  void sync_summary::
  add (const sync_outcome& o)
  {
    switch (o.status)
    {
      case sync_status::completed: ++completed; break;
      case sync_status::skipped:   ++skipped;   break;
      case sync_status::failed:    ++failed;    break;
    }

    if (o.hash_mismatch)
      ++hash_mismatches;

    bytes += o.bytes;
  }
}
