#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <gogsync/catalog/catalog-json.hxx>
#include <gogsync/progress/progress-format.hxx>
#include <gogsync/progress/progress-reporter.hxx>
#include <gogsync/sync/sync-engine.hxx>
#include <gogsync/transfer/transfer-engine.hxx>

#include <gogsync/gogsync-options.hxx>
#include <gogsync/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace gogsync
{
  // Resolve the download directory: the argument, DOWNLOAD_DIRECTORY, or
  // GOG-Downloads in the current directory, made absolute.
  //
  static fs::path
  resolve_directory (const optional<string>& a)
  {
    fs::path d;
    const char* e (getenv ("DOWNLOAD_DIRECTORY"));

    if (a)
      d = *a;
    else if (e != nullptr && *e != '\0')
      d = e;
    else
      d = "GOG-Downloads";

    if (d.is_relative ())
      d = fs::current_path () / d;

    return d.lexically_normal ();
  }

  // Map the command line to the run configuration.
  //
  // Throw cli::invalid_value for values the parser cannot check itself.
  //
  static sync_options
  resolve_options (const options& opt, const optional<string>& dir)
  {
    sync_options r;

    r.target_directory = resolve_directory (dir);

    if (opt.os_specified ())
    {
      r.operating_system = parse_platform (opt.os ());

      if (!r.operating_system)
        throw cli::invalid_value ("--os", opt.os ());
    }

    if (opt.language_specified ())
      r.language = opt.language ();

    if (opt.exclude_game_with_language_specified ())
      r.exclude_language = opt.exclude_game_with_language ();

    r.english_fallback = opt.language_fallback_english ();

    if (opt.retry () == 0)
      throw cli::invalid_value ("--retry", "0");

    if (opt.idle_timeout () == 0)
      throw cli::invalid_value ("--idle-timeout", "0");

    r.retry_count = opt.retry ();
    r.retry_delay = chrono::seconds (opt.retry_delay ());
    r.idle_timeout = chrono::seconds (opt.idle_timeout ());

    r.skip_errors = opt.skip_errors ();
    r.dry_run = opt.dry_run ();
    r.create_md5 = opt.create_md5 ();
    r.no_verify = opt.no_verify ();

    r.verbosity = opt.V () ? 3 : opt.v () ? 2 : opt.quiet () ? 0 : 1;

    return r;
  }

  static string
  resolve_token (const options& opt)
  {
    if (opt.token_specified ())
      return opt.token ();

    const char* e (getenv ("GOGSYNC_TOKEN"));
    return e != nullptr ? e : string ();
  }
}

int
main (int argc, char* argv[])
{
  using namespace gogsync;

  try
  {
    // Options can appear anywhere, what is left is the directory.
    //
    options opt (argc,
                 argv,
                 true,
                 cli::unknown_mode::fail,
                 cli::unknown_mode::skip);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "gogsync " << GOGSYNC_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: gogsync [options] [<directory>]" << "\n"
        << "options:"                                << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (argc > 2)
      throw cli::unexpected_argument (argv[2]);

    if (!opt.catalog_specified ())
    {
      cerr << "error: catalog file expected" << "\n"
           << "  info: specify --catalog <file>" << "\n";
      return 2;
    }

    sync_options so (
      resolve_options (opt, argc == 2 ? optional<string> (argv[1])
                                      : nullopt));

    if (so.verbosity >= 2)
      cout << "downloading to " << so.target_directory.string () << "\n";

    json_catalog catalog (fs::path (opt.catalog ()));

    if (so.verbosity >= 2)
      cout << "loaded " << catalog.size () << " games from "
           << opt.catalog () << "\n";

    asio::io_context ioc;

    token_provider tp;
    if (string t = resolve_token (opt); !t.empty ())
      tp = [t] () {return t;};

    transfer_engine transport (ioc, move (tp));

    unique_ptr<progress_reporter> progress;
    if (so.verbosity >= 1)
      progress = make_unique<progress_reporter> (cout, so.verbosity >= 3);

    sync_engine engine (transport, so, progress.get ());

    int r (0);
    sync_summary sum;

    asio::co_spawn (
      ioc,
      engine.run (catalog),
      [&r, &sum] (exception_ptr ex, sync_summary s)
      {
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            r = 1;
          }
        }
        else
          sum = s;
      });

    ioc.run ();

    if (r == 0 && so.verbosity >= 1)
    {
      cout << sum.completed << (so.dry_run ? " simulated, " : " downloaded, ")
           << sum.skipped << " skipped, "
           << sum.failed << " failed ("
           << format_bytes (sum.bytes, so.verbosity >= 3) << ")" << "\n";

      if (sum.hash_mismatches != 0)
        cerr << "warning: " << sum.hash_mismatches
             << " file(s) failed hash check" << "\n";
    }

    return r;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 2;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
