#include <bulkfetch/bulkfetch-progress.hxx>

#include <cstdlib>  // getenv()
#include <cstring>  // strcmp()

#include <unistd.h> // isatty()

using namespace std;

namespace bulkfetch
{
  bool
  stdout_fancy ()
  {
    if (!isatty (STDOUT_FILENO))
      return false;

    const char* t (getenv ("TERM"));
    return t != nullptr && strcmp (t, "dumb") != 0;
  }

  progress_reporter::
  progress_reporter (asio::io_context& ioc,
                     ostream& os,
                     size_t total,
                     verbosity v,
                     bool interactive)
    : os_ (os), verbosity_ (v)
  {
    if (interactive && v != verbosity::quiet)
      manager_ = make_unique<manager_type> (ioc, os, total);
  }

  void progress_reporter::
  start ()
  {
    if (manager_ != nullptr)
      manager_->start ();
  }

  void progress_reporter::
  stop ()
  {
    if (manager_ != nullptr)
      manager_->stop ();
  }

  shared_ptr<progress_reporter::entry_type> progress_reporter::
  entry (const string& n)
  {
    auto i (entries_.find (n));
    if (i != entries_.end ())
      return i->second;

    auto e (manager_->add_entry (n));
    entries_.emplace (n, e);
    return e;
  }

  void progress_reporter::
  line (const string& l)
  {
    // Above the live display the line goes into its log area, otherwise
    // straight out.
    //
    if (manager_ != nullptr)
      manager_->add_log (l);
    else
      os_ << l << endl;
  }

  void progress_reporter::
  status (const string& n, const string& m)
  {
    if (manager_ != nullptr)
      entry (n);

    if (verbosity_ >= verbosity::verbose)
      line (n + ": " + m);
  }

  void progress_reporter::
  retry (const string& n, const string& m)
  {
    if (verbosity_ >= verbosity::normal)
      line (n + ": " + m);
  }

  void progress_reporter::
  bytes (const string& n, uint64_t d, optional<uint64_t> t)
  {
    if (manager_ != nullptr)
    {
      entry (n)->update (d, t ? *t : 0);
      return;
    }

    if (verbosity_ < verbosity::verbose)
      return;

    // Once a second per entry is plenty for a log.
    //
    using namespace chrono;

    steady_clock::time_point now (steady_clock::now ());
    auto i (printed_.find (n));

    if (i != printed_.end () && now - i->second < seconds (1))
      return;

    printed_[n] = now;

    string l (n + ": " + progress_tracker_traits<>::format_bytes (d));
    if (t)
      l += " / " + progress_tracker_traits<>::format_bytes (*t);

    os_ << l << endl;
  }

  void progress_reporter::
  finished (const transfer_outcome& o)
  {
    const string& n (o.entry.name);

    if (manager_ != nullptr)
    {
      auto i (entries_.find (n));
      if (i != entries_.end ())
      {
        manager_->remove_entry (i->second, !o.succeeded ());
        entries_.erase (i);
      }
    }

    printed_.erase (n);

    // Failures are reported in the summary as well, so they are only
    // reported here at the normal level and above.
    //
    if (verbosity_ < verbosity::normal)
      return;

    string l (n + ": " + to_string (o.status));

    if (o.error)
      l += ": " + *o.error;

    line (l);
  }
}
