#include <bulkfetch/catalog/catalog-types.hxx>

#include <stdexcept>

using namespace std;

namespace bulkfetch
{
  bool
  valid_entry_name (const string& n)
  {
    if (n.empty () || n == "." || n == "..")
      return false;

    // Backslash is a separator on Windows and we want a catalog to produce
    // the same layout everywhere.
    //
    return n.find_first_of (string ("/\\\0", 3)) == string::npos;
  }

  string
  to_string (selection_mode m)
  {
    switch (m)
    {
      case selection_mode::all:    return "all";
      case selection_mode::single: return "single";
      case selection_mode::range:  return "range";
    }
    return "all";
  }

  selection_mode
  to_selection_mode (const string& s)
  {
    if (s == "all")    return selection_mode::all;
    if (s == "single") return selection_mode::single;
    if (s == "range")  return selection_mode::range;

    throw invalid_argument ("invalid download mode '" + s +
                            "' (expected all, single, or range)");
  }
}
