#include <fstream>
#include <utility>
#include <stdexcept>
#include <system_error>

#include <gogsync/gogsync-error.hxx>
#include <gogsync/retry/retry.hxx>
#include <gogsync/sync/sync-filter.hxx>

namespace gogsync
{
  template <typename T>
  basic_sync_engine<T>::
  basic_sync_engine (transport_type& t,
                     sync_options o,
                     progress_reporter* p,
                     std::ostream& out,
                     std::ostream& err)
    : transport_ (t),
      options_ (std::move (o)),
      progress_ (p),
      out_ (out),
      err_ (err)
  {
    if (options_.retry_count == 0)
      throw std::invalid_argument ("retry count must be at least 1");
  }

  template <typename T>
  asio::awaitable<sync_summary> basic_sync_engine<T>::
  run (catalog_source& src)
  {
    const sync_options& o (options_);

    if (o.language && *o.language != english_language && !o.english_fallback)
    {
      err_ << "warning: GOG often has multiple language versions inside the "
           << "English one, those game files will be skipped" << '\n'
           << "  info: specify --language-fallback-english to include "
           << "English versions if your language's version doesn't exist"
           << std::endl;
    }

    sync_summary r;

    while (std::optional<game_entry> g = src.next ())
    {
      std::vector<sync_outcome> os (co_await sync_game (*g));

      for (const sync_outcome& x: os)
        r.add (x);
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::vector<sync_outcome>> basic_sync_engine<T>::
  sync_game (const game_entry& g)
  {
    std::vector<std::optional<skip_reason>> p (plan_game (g, options_));

    std::vector<sync_outcome> r;
    r.reserve (p.size ());

    for (std::size_t i (0); i != p.size (); ++i)
    {
      const download_descriptor& d (g.downloads[i]);

      if (p[i])
      {
        skipped (d, *p[i]);
        r.push_back (sync_outcome::skipped (*p[i]));
      }
      else
        r.push_back (co_await sync_file (g, d));
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<sync_outcome> basic_sync_engine<T>::
  sync_file (const game_entry& g, const download_descriptor& d)
  {
    fs::path dir (target_directory (options_.target_directory, g));
    transfer_session s {d, dir, dir / target_filename (d), d.label ()};

    std::optional<sync_outcome> r;

    try
    {
      r = co_await retry (
        [this, &s] () -> asio::awaitable<sync_outcome>
        {
          co_return co_await attempt (s);
        },
        options_.retry_count,
        options_.retry_delay,
        [this, &s] (std::size_t i, const std::string& m)
        {
          if (options_.verbosity >= 2)
            err_ << "warning: " << s.label << ": attempt " << i
                 << " failed: " << m << ", retrying" << std::endl;
        });
    }
    catch (const too_many_retries& e)
    {
      if (!options_.skip_errors)
        throw;

      err_ << "warning: " << s.label << ": " << e.what () << '\n'
           << "note: " << d.name << " couldn't be downloaded" << std::endl;

      r = sync_outcome::failed (e.last_error, e.last_message);
    }

    co_return std::move (*r);
  }

  template <typename T>
  asio::awaitable<sync_outcome> basic_sync_engine<T>::
  attempt (transfer_session& s)
  {
    const download_descriptor& d (s.descriptor);

    // The sidecar holds the declared hash, dry run included.
    //
    if (options_.create_md5)
      write_sidecar (s);

    disposition p (dispose (s));

    if (p.done)
    {
      if (p.done->reason)
        skipped (d, *p.done->reason);

      co_return std::move (*p.done);
    }

    if (options_.dry_run)
    {
      if (progress_ != nullptr)
      {
        progress_->start (s.label);
        progress_->update (d.size, d.size);
        progress_->finish ();
      }

      sync_outcome r (sync_outcome::completed (d.size));
      r.dry_run = true;
      co_return r;
    }

    co_return co_await transfer (s, p.offset);
  }

  template <typename T>
  void basic_sync_engine<T>::
  write_sidecar (transfer_session& s)
  {
    const download_descriptor& d (s.descriptor);

    if (!d.md5 || d.md5->empty ())
      return;

    fs::path f (s.file);
    f += traits_type::sidecar_suffix;

    std::error_code ec;
    if (fs::exists (f, ec))
      return;

    fs::create_directories (s.directory, ec);
    if (ec)
      throw io_error ("unable to create directory", s.directory, ec);

    std::ofstream os (f, std::ios::binary | std::ios::trunc);
    if (!os)
      throw io_error ("unable to create checksum file", f);

    os << *d.md5;
    os.close ();

    if (!os)
      throw io_error ("unable to write checksum file", f);
  }

  template <typename T>
  typename basic_sync_engine<T>::disposition basic_sync_engine<T>::
  dispose (transfer_session& s)
  {
    const download_descriptor& d (s.descriptor);

    disposition r;

    std::error_code ec;
    bool e (fs::exists (s.file, ec));
    if (ec)
      throw io_error ("unable to access", s.file, ec);

    if (!e)
      return r;

    // Without verification a file we did not write is left alone. What an
    // earlier attempt of ours left behind is started over.
    //
    if (options_.no_verify)
    {
      if (!s.written)
        r.done = sync_outcome::skipped (skip_reason::existing_untrusted);

      return r;
    }

    // Nothing to validate against, download again.
    //
    if (!d.md5 || d.md5->empty ())
      return r;

    if (compare_hashes (hash_file (s.file), *d.md5))
    {
      r.done = s.written
        ? sync_outcome::completed (0)
        : sync_outcome::skipped (skip_reason::existing_valid);

      return r;
    }

    std::uint64_t n (fs::file_size (s.file, ec));
    if (ec)
      throw io_error ("unable to query size of", s.file, ec);

    // Appending to a file that already has the declared size (or more)
    // cannot make it valid.
    //
    if (d.size != 0 && n >= d.size)
    {
      if (options_.verbosity >= 2)
        out_ << s.label << ": existing file does not match, downloading "
             << "again" << std::endl;

      return r;
    }

    if (n != 0)
    {
      if (options_.verbosity >= 2)
        out_ << s.label << ": resuming at byte " << n << std::endl;

      r.offset = n;
    }

    return r;
  }

  template <typename T>
  asio::awaitable<sync_outcome> basic_sync_engine<T>::
  transfer (transfer_session& s, std::optional<std::uint64_t> offset)
  {
    const download_descriptor& d (s.descriptor);

    if (progress_ != nullptr)
      progress_->start (s.label);

    try
    {
      transfer_progress pc;

      if (progress_ != nullptr)
      {
        pc = [p = progress_] (std::uint64_t c, std::uint64_t t)
        {
          if (t > 0)
            p->update (c, t);
        };
      }

      stream_type in (co_await transport_.download (d,
                                                    std::move (pc),
                                                    offset,
                                                    options_.idle_timeout));

      std::error_code ec;
      fs::create_directories (s.directory, ec);
      if (ec)
        throw io_error ("unable to create directory", s.directory, ec);

      // Seed the digest with the prefix we keep, read back from disk.
      //
      hash_context h;
      if (offset)
        h.update (s.file, *offset);

      std::ios_base::openmode m (std::ios::binary | std::ios::out);
      m |= offset ? std::ios::app : std::ios::trunc;

      std::ofstream os (s.file, m);
      if (!os)
        throw io_error ("unable to open for writing", s.file);

      s.written = true;

      std::uint64_t size (offset ? *offset : 0);
      std::uint64_t received (0);

      transfer_chunk c;
      while (co_await in.next (c))
      {
        if (d.size != 0 && size + c.size () > d.size)
          throw transport_error ("server sent more than the declared " +
                                 std::to_string (d.size) + " bytes for " +
                                 s.label);

        os.write (c.data (), static_cast<std::streamsize> (c.size ()));
        if (!os)
          throw io_error ("unable to write", s.file);

        h.update (c.data (), c.size ());

        size += c.size ();
        received += c.size ();
      }

      os.close ();
      if (!os)
        throw io_error ("unable to write", s.file);

      bool mismatch (!options_.no_verify &&
                     d.md5 && !d.md5->empty () &&
                     !compare_hashes (h.finalize (), *d.md5));

      if (progress_ != nullptr)
        progress_->finish ();

      // A mismatch is not retried and the file is kept.
      //
      if (mismatch)
        err_ << "warning: " << s.label << " failed hash check" << std::endl;

      co_return sync_outcome::completed (received, mismatch);
    }
    catch (...)
    {
      if (progress_ != nullptr)
        progress_->abandon ();

      throw;
    }
  }

  template <typename T>
  void basic_sync_engine<T>::
  skipped (const download_descriptor& d, skip_reason r)
  {
    if (options_.verbosity >= 2)
      out_ << d.label () << ": Skipping because " << r << std::endl;
  }
}
