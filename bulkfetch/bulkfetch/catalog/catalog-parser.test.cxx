#include <bulkfetch/catalog/catalog-parser.hxx>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <bulkfetch/catalog/catalog-types.hxx>

using namespace std;
using namespace bulkfetch;

namespace fs = std::filesystem;

// Header line, tab-separated pairs, and the sort that follows.
//
static void
test_basic ()
{
  istringstream is ("file_name\tcdn_link\n"
                    "sa_000002.tar\thttps://x/b?sig=1\n"
                    "sa_000001.tar\thttps://x/a?sig=2\n");

  catalog c (parse_catalog (is));

  assert (c.size () == 2);
  assert (c[0] == catalog_entry ("sa_000001.tar", "https://x/a?sig=2"));
  assert (c[1] == catalog_entry ("sa_000002.tar", "https://x/b?sig=1"));
}

// Only the first line may be a header. Anywhere else it is just an entry
// named "file_name".
//
static void
test_header ()
{
  istringstream is ("a\thttp://x/a\n"
                    "file_name\thttp://x/f\n");

  catalog c (parse_catalog (is));

  assert (c.size () == 2);
  assert (c[0].name == "a");
  assert (c[1].name == "file_name");
}

// Junk is skipped rather than rejected: blank lines, lines without a tab,
// empty URLs, and names that would escape the output directory.
//
static void
test_malformed ()
{
  istringstream is ("\n"
                    "no-tab-here http://x/a\n"
                    "empty\t   \n"
                    "../escape\thttp://x/e\n"
                    "sub/dir\thttp://x/s\n"
                    "..\thttp://x/p\n"
                    "\thttp://x/noname\n"
                    "good\t  http://x/g \r\n");

  catalog c (parse_catalog (is));

  assert (c.size () == 1);
  assert (c[0].name == "good");
  assert (c[0].url == "http://x/g"); // Trimmed, including the CR.
}

// Duplicates keep the first URL seen.
//
static void
test_duplicates ()
{
  istringstream is ("b\thttp://x/b1\n"
                    "a\thttp://x/a\n"
                    "b\thttp://x/b2\n");

  catalog c (parse_catalog (is));

  assert (c.size () == 2);
  assert (c[1] == catalog_entry ("b", "http://x/b1"));
}

// Extra columns are ignored.
//
static void
test_extra_columns ()
{
  istringstream is ("a\thttp://x/a\t12345\tmd5\n");

  catalog c (parse_catalog (is));

  assert (c.size () == 1);
  assert (c[0].url == "http://x/a");
}

static catalog
make_catalog (size_t n)
{
  catalog c;
  for (size_t i (0); i != n; ++i)
    c.emplace_back ("f" + std::to_string (i), "http://x/" + std::to_string (i));
  return c;
}

static void
test_select ()
{
  catalog c (make_catalog (10));

  // All.
  //
  {
    catalog_selection s;
    assert (select_entries (c, s) == c);
  }

  // Single.
  //
  {
    catalog_selection s;
    s.mode = selection_mode::single;
    s.name = "f3";

    catalog r (select_entries (c, s));
    assert (r.size () == 1 && r[0].name == "f3");
  }

  // Range, inclusive on both ends.
  //
  {
    catalog_selection s;
    s.mode = selection_mode::range;
    s.start = 2;
    s.end = 4;

    catalog r (select_entries (c, s));
    assert (r.size () == 3);
    assert (r.front ().name == "f2" && r.back ().name == "f4");
  }

  // Single-element range.
  //
  {
    catalog_selection s;
    s.mode = selection_mode::range;
    s.start = 9;
    s.end = 9;

    assert (select_entries (c, s).size () == 1);
  }
}

static bool
rejected (const catalog& c, const catalog_selection& s)
{
  try
  {
    select_entries (c, s);
    return false;
  }
  catch (const invalid_argument&)
  {
    return true;
  }
}

// Bad selections are configuration errors, reported before anything is
// scheduled.
//
static void
test_select_invalid ()
{
  catalog c (make_catalog (10));

  catalog_selection s;
  s.mode = selection_mode::range;

  // Inverted.
  //
  s.start = 5;
  s.end = 2;
  assert (rejected (c, s));

  // Out of bounds.
  //
  s.start = 0;
  s.end = 10;
  assert (rejected (c, s));

  // Missing end.
  //
  s.end = nullopt;
  assert (rejected (c, s));

  // Single without a name, or with an unknown one.
  //
  catalog_selection n;
  n.mode = selection_mode::single;
  assert (rejected (c, n));

  n.name = "nope";
  assert (rejected (c, n));
}

static void
test_mode ()
{
  assert (to_selection_mode ("all") == selection_mode::all);
  assert (to_selection_mode ("range") == selection_mode::range);
  assert (to_string (selection_mode::single) == "single");

  bool thrown (false);
  try
  {
    to_selection_mode ("some");
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);
}

static void
test_load ()
{
  fs::path d (fs::temp_directory_path () / "bulkfetch-catalog-test");
  fs::remove_all (d);
  fs::create_directories (d);

  // Missing file is a configuration error.
  //
  bool thrown (false);
  try
  {
    load_catalog (d / "missing.txt");
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);

  {
    ofstream ofs (d / "links.txt");
    ofs << "file_name\tcdn_link\n"
        << "z\thttp://x/z\n"
        << "y\thttp://x/y\n";
  }

  catalog c (load_catalog (d / "links.txt"));
  assert (c.size () == 2 && c[0].name == "y");

  // A file with nothing usable in it is a configuration error as well.
  //
  {
    ofstream ofs (d / "empty.txt");
    ofs << "file_name\tcdn_link\n"
        << "\n"
        << "broken line\n";
  }

  thrown = false;
  try
  {
    load_catalog (d / "empty.txt");
  }
  catch (const invalid_argument& e)
  {
    thrown = string (e.what ()).find ("no entries") != string::npos;
  }
  assert (thrown);

  fs::remove_all (d);
}

int
main ()
{
  test_basic ();
  test_header ();
  test_malformed ();
  test_duplicates ();
  test_extra_columns ();
  test_select ();
  test_select_invalid ();
  test_mode ();
  test_load ();
}
