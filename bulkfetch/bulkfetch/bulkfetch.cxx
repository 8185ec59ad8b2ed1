#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <exception>
#include <stdexcept>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include <bulkfetch/http/http.hxx>
#include <bulkfetch/catalog/catalog-parser.hxx>
#include <bulkfetch/catalog/catalog-types.hxx>
#include <bulkfetch/transfer/transfer.hxx>

#include <bulkfetch/bulkfetch-options.hxx>
#include <bulkfetch/bulkfetch-progress.hxx>
#include <bulkfetch/bulkfetch-transfer.hxx>

#include <bulkfetch/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace bulkfetch
{
  // Turn the selection options into a selection, rejecting combinations that
  // make no sense for the mode.
  //
  static catalog_selection
  selection (const options& opt)
  {
    catalog_selection s;
    s.mode = to_selection_mode (opt.mode ());

    if (opt.file_specified ())
      s.name = opt.file ();

    if (opt.start_specified ())
      s.start = opt.start ();

    if (opt.end_specified ())
      s.end = opt.end ();

    return s;
  }

  static void
  validate (const options& opt)
  {
    if (opt.threads () == 0)
      throw invalid_argument ("--threads must be at least 1");

    if (opt.retries () == 0)
      throw invalid_argument ("--retries must be at least 1");

    if (opt.quiet () && opt.verbose ())
      throw invalid_argument ("--quiet and --verbose are mutually exclusive");

    if (opt.proxy_specified ())
    {
      url_parts u (parse_url (opt.proxy ()));
      if (u.scheme != "http")
        throw invalid_argument ("only http:// proxies are supported: " +
                                opt.proxy ());
    }
  }
}

int
main (int argc, char* argv[])
{
  using namespace bulkfetch;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "bulkfetch " << BULKFETCH_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: bulkfetch [options]" << "\n"
        << "options:"                   << "\n";

      opt.print_usage (o);

      return 0;
    }

    // Everything that can be wrong with the configuration is reported before
    // we touch the network or the output directory.
    //
    validate (opt);

    catalog_selection sel (selection (opt));

    fs::path lf (opt.link_file ());
    catalog all (load_catalog (lf));

    verbosity v (opt.quiet ()   ? verbosity::quiet   :
                 opt.verbose () ? verbosity::verbose :
                                  verbosity::normal);

    if (v != verbosity::quiet)
      cout << "loaded " << all.size () << " entries from " << lf.string ()
           << endl;

    catalog c (select_entries (all, sel));

    // Configure the transfers.
    //
    http_client_traits<> ht;
    ht.connect_timeout = opt.connect_timeout () * 1000;
    ht.request_timeout = opt.request_timeout () * 1000;

    if (opt.proxy_specified ())
      ht.proxy = opt.proxy ();

    transfer_options to;
    to.output_dir = fs::path (opt.output ());
    to.concurrency = opt.threads ();
    to.resume = !opt.no_resume ();
    to.retry.attempts = opt.retries ();
    to.retry.retry_integrity = !opt.no_integrity_retry ();

    asio::io_context ioc;

    progress_reporter reporter (ioc,
                                cout,
                                c.size (),
                                v,
                                !opt.no_progress () && stdout_fancy ());

    transfer_coordinator tc (ioc, ht, move (to), reporter);

    // On SIGINT/SIGTERM stop admitting, let the running transfers notice at
    // their next suspension point, and still save the progress record. A
    // second signal doesn't get any special treatment: the record is saved
    // once everything has unwound, which doesn't take long.
    //
    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    signals.async_wait ([&tc, v] (const boost::system::error_code& ec, int)
                        {
                          if (ec)
                            return;

                          if (v != verbosity::quiet)
                            cerr << "info: interrupted, finishing up" << endl;

                          tc.cancel ();
                        });

    optional<transfer_summary> summary;
    exception_ptr failure;

    reporter.start ();

    asio::co_spawn (
      ioc,
      tc.execute (c),
      [&summary, &failure, &signals, &reporter] (exception_ptr ex,
                                                 transfer_summary s)
      {
        if (ex)
          failure = ex;
        else
          summary = move (s);

        reporter.stop ();

        boost::system::error_code ec;
        signals.cancel (ec);
      });

    ioc.run ();

    if (failure)
      rethrow_exception (failure);

    const transfer_summary& s (*summary);

    for (const transfer_outcome& o: s.outcomes)
    {
      if (!o.succeeded () && o.status != transfer_status::cancelled)
        cerr << "error: " << o.entry.name << ": "
             << (o.error ? *o.error : to_string (o.status)) << endl;
    }

    cout << "done: " << s.succeeded << " succeeded, " << s.failed
         << " failed";

    if (s.cancelled != 0)
      cout << ", " << s.cancelled << " cancelled";

    cout << endl;

    // Failed entries are not a failure of the run: the summary says what
    // happened and a rerun picks up where this one left off. Being
    // interrupted is, though.
    //
    return s.cancelled != 0 ? 1 : 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
