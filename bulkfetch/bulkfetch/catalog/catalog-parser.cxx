#include <bulkfetch/catalog/catalog-parser.hxx>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_set>

using namespace std;

namespace bulkfetch
{
  static inline string
  trim (const string& s)
  {
    const char* ws (" \t\r\n");

    size_t b (s.find_first_not_of (ws));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (ws));
    return s.substr (b, e - b + 1);
  }

  catalog
  parse_catalog (istream& is)
  {
    catalog r;
    unordered_set<string> seen;

    string l;
    for (size_t i (0); getline (is, l); ++i)
    {
      if (i == 0 && l.compare (0, 9, "file_name") == 0)
        continue;

      // Split on the first tab. Anything past a second tab belongs to
      // columns we don't use.
      //
      size_t t (l.find ('\t'));
      if (t == string::npos)
        continue;

      string n (l.substr (0, t));

      size_t e (l.find ('\t', t + 1));
      string u (trim (l.substr (t + 1, e == string::npos ? e : e - t - 1)));

      if (u.empty () || !valid_entry_name (n))
        continue;

      if (!seen.insert (n).second)
        continue;

      r.emplace_back (move (n), move (u));
    }

    if (is.bad ())
      throw runtime_error ("failed to read catalog");

    // The index range selection refers to positions in this order so it
    // must be deterministic across runs.
    //
    sort (r.begin (), r.end (),
          [] (const catalog_entry& x, const catalog_entry& y)
          {
            return x.name < y.name;
          });

    return r;
  }

  catalog
  load_catalog (const fs::path& p)
  {
    error_code ec;
    if (!fs::exists (p, ec))
      throw invalid_argument ("link file not found: " + p.string ());

    ifstream ifs (p);
    if (!ifs)
      throw runtime_error ("unable to open link file " + p.string ());

    catalog r;
    try
    {
      r = parse_catalog (ifs);
    }
    catch (const runtime_error& e)
    {
      throw runtime_error (p.string () + ": " + e.what ());
    }

    // Nothing to do is almost certainly the wrong file.
    //
    if (r.empty ())
      throw invalid_argument ("no entries found in link file " + p.string ());

    return r;
  }

  catalog
  select_entries (const catalog& c, const catalog_selection& s)
  {
    switch (s.mode)
    {
    case selection_mode::all:
      return c;

    case selection_mode::single:
      {
        if (!s.name)
          throw invalid_argument ("--file is required in single mode");

        auto i (find_if (c.begin (), c.end (),
                         [&s] (const catalog_entry& e)
                         {
                           return e.name == *s.name;
                         }));

        if (i == c.end ())
          throw invalid_argument ("file not found in link file: " + *s.name);

        return catalog {*i};
      }

    case selection_mode::range:
      {
        if (!s.start || !s.end)
          throw invalid_argument (
            "--start and --end are required in range mode");

        size_t b (*s.start), e (*s.end);

        if (b >= c.size () || e >= c.size () || b > e)
          throw invalid_argument ("invalid range: start=" +
                                  std::to_string (b) +
                                  ", end=" + std::to_string (e) +
                                  ", total=" + std::to_string (c.size ()));

        return catalog (c.begin () + b, c.begin () + e + 1);
      }
    }

    return c;
  }
}
