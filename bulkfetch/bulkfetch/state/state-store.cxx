#include <bulkfetch/state/state-store.hxx>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace bulkfetch
{
  state_store::
  state_store (const fs::path& output_dir)
    : path_ (output_dir / file_name)
  {
  }

  void state_store::
  load (bool resume)
  {
    lock_guard<mutex> l (mutex_);
    map_.clear ();

    if (!resume)
      return;

    error_code ec;
    if (!fs::exists (path_, ec))
    {
      if (ec)
        throw runtime_error ("unable to stat " + path_.string () + ": " +
                             ec.message ());
      return;
    }

    ifstream ifs (path_, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + path_.string ());

    string s ((istreambuf_iterator<char> (ifs)), istreambuf_iterator<char> ());

    if (ifs.bad ())
      throw runtime_error ("unable to read " + path_.string ());

    boost::system::error_code jec;
    json::value jv (json::parse (s, jec));

    auto ignore = [this] (const string& what)
    {
      cerr << "warning: ignoring progress record " << path_.string ()
           << ": " << what << endl;
    };

    if (jec)
    {
      ignore (jec.message ());
      return;
    }

    if (!jv.is_array ())
    {
      ignore ("expected an array");
      return;
    }

    map<string, transfer_progress> m;
    try
    {
      for (const json::value& e: jv.as_array ())
      {
        transfer_progress p (progress_from_json (e));
        string n (p.name);
        m[move (n)] = move (p);
      }
    }
    catch (const invalid_argument& e)
    {
      ignore (e.what ());
      return;
    }

    map_ = move (m);
  }

  void state_store::
  save () const
  {
    // Serialize under the lock, write without it.
    //
    string s ("[");
    {
      lock_guard<mutex> l (mutex_);

      bool first (true);
      for (const auto& p: map_)
      {
        s += first ? "\n  " : ",\n  ";
        s += json::serialize (to_json (p.second));
        first = false;
      }
    }
    s += s.size () == 1 ? "]\n" : "\n]\n";

    // Write next to the record and rename over it so that a crash leaves
    // either the old or the new record, never a torn one.
    //
    fs::path t (path_);
    t += ".tmp";

    {
      ofstream ofs (t, ios::binary | ios::trunc);
      if (!ofs)
        throw runtime_error ("unable to open " + t.string () +
                             " for writing");

      ofs.write (s.data (), static_cast<streamsize> (s.size ()));
      ofs.flush ();

      if (!ofs)
        throw runtime_error ("unable to write " + t.string ());
    }

    error_code ec;
    fs::rename (t, path_, ec);

    if (ec)
    {
      error_code rec;
      fs::remove (t, rec);

      throw runtime_error ("unable to replace " + path_.string () + ": " +
                           ec.message ());
    }
  }

  optional<transfer_progress> state_store::
  find (const string& n) const
  {
    lock_guard<mutex> l (mutex_);

    auto i (map_.find (n));
    if (i == map_.end ())
      return nullopt;

    return i->second;
  }

  void state_store::
  merge (transfer_progress p)
  {
    lock_guard<mutex> l (mutex_);

    string n (p.name);
    map_[move (n)] = move (p);
  }

  vector<transfer_progress> state_store::
  entries () const
  {
    lock_guard<mutex> l (mutex_);

    vector<transfer_progress> r;
    r.reserve (map_.size ());

    for (const auto& p: map_)
      r.push_back (p.second);

    return r;
  }

  size_t state_store::
  size () const
  {
    lock_guard<mutex> l (mutex_);
    return map_.size ();
  }
}
