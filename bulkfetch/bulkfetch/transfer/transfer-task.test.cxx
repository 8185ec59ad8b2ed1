#include <bulkfetch/transfer/transfer-task.hxx>

#include <atomic>
#include <cassert>
#include <string>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include <bulkfetch/catalog/catalog-types.hxx>
#include <bulkfetch/state/state-types.hxx>
#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>
#include <bulkfetch/transfer/fake-client.test.hxx>

using namespace std;
using namespace bulkfetch;
using namespace bulkfetch::test;

namespace asio = boost::asio;
namespace fs   = std::filesystem;

using task = basic_transfer_task<fake_traits>;

const string url ("https://cdn.example/obj");

// Everything a test needs: a scratch output directory, a fake server with
// one object, and a task wired to both.
//
struct fixture
{
  explicit
  fixture (const string& n, bool resume = true)
    : dir (scratch ("task-" + n)),
      client (ioc),
      t (client, ioc.get_executor (), dir, resume, observer, cancel),
      entry ("obj.bin", url),
      progress ("obj.bin")
  {
  }

  ~fixture () {fs::remove_all (dir);}

  fake_object&
  object (string body)
  {
    fake_object& o (client.objects[url]);
    o.body = move (body);
    return o;
  }

  transfer_status
  run ()
  {
    return test::run (ioc, t.run (entry, progress));
  }

  // Run expecting failure and return its kind.
  //
  transfer_error_kind
  fail ()
  {
    try
    {
      run ();
    }
    catch (const transfer_error& e)
    {
      return e.kind ();
    }
    catch (const exception&)
    {
      return classify_error (current_exception ());
    }

    assert (false);
    return transfer_error_kind::transport;
  }

  fs::path output () const {return dir / "obj.bin";}
  fs::path partial () const {return dir / "obj.bin.part";}

  asio::io_context ioc;
  fs::path dir;
  null_transfer_observer observer;
  atomic<bool> cancel {false};
  fake_client client;
  task t;
  catalog_entry entry;
  transfer_progress progress;
};

static void
test_fresh ()
{
  fixture f ("fresh");
  string c (content (2500));
  f.object (c);

  assert (f.run () == transfer_status::done);

  assert (read_file (f.output ()) == c);
  assert (!fs::exists (f.partial ()));
  assert (f.client.gets == 1 && f.client.offsets[0] == 0);

  assert (f.progress.completed);
  assert (f.progress.downloaded_bytes == 2500);
  assert (f.progress.total_bytes && *f.progress.total_bytes == 2500);
}

// A complete file is left alone and nothing is fetched.
//
static void
test_skip ()
{
  fixture f ("skip");
  string c (content (2500));
  f.object (c);
  write_file (f.output (), c);

  assert (f.run () == transfer_status::skipped);
  assert (f.client.gets == 0);
  assert (f.progress.completed && f.progress.downloaded_bytes == 2500);
}

// A wrong-sized file is replaced, not trusted.
//
static void
test_corrupt ()
{
  fixture f ("corrupt");
  string c (content (2500));
  f.object (c);
  write_file (f.output (), content (50, 'x'));

  f.progress.completed = true;
  f.progress.downloaded_bytes = 50;

  assert (f.run () == transfer_status::done);
  assert (read_file (f.output ()) == c);
  assert (f.client.gets == 1);
}

// The partial file is picked up where it ends. Here the file work runs on
// a real pool, as it does in the tool.
//
static void
test_resume ()
{
  asio::thread_pool pool (2);

  asio::io_context ioc;
  fs::path d (scratch ("task-resume"));
  null_transfer_observer o;
  atomic<bool> cancel (false);
  fake_client client (ioc);

  string c (content (2500));
  client.objects[url].body = c;
  write_file (d / "obj.bin.part", c.substr (0, 1000));

  task t (client, pool.get_executor (), d, true, o, cancel);
  catalog_entry e ("obj.bin", url);
  transfer_progress p ("obj.bin");

  assert (test::run (ioc, t.run (e, p)) == transfer_status::done);
  assert (client.offsets.size () == 1 && client.offsets[0] == 1000);
  assert (read_file (d / "obj.bin") == c);
  assert (p.completed && p.downloaded_bytes == 2500);

  pool.join ();
  fs::remove_all (d);
}

// Partial longer than the content: reported, nothing fetched, nothing
// truncated.
//
static void
test_overlong_partial ()
{
  fixture f ("overlong");
  f.object (content (2500));
  write_file (f.partial (), content (3000));

  assert (f.fail () == transfer_error_kind::integrity);
  assert (f.client.gets == 0);
  assert (fs::file_size (f.partial ()) == 3000);
  assert (!fs::exists (f.output ()));
}

// Partial already complete: finalized without a fetch.
//
static void
test_complete_partial ()
{
  fixture f ("complete-partial");
  string c (content (2500));
  f.object (c);
  write_file (f.partial (), c);

  assert (f.run () == transfer_status::done);
  assert (f.client.gets == 0);
  assert (read_file (f.output ()) == c);
}

// Interrupted transfer leaves a usable partial; the next attempt resumes.
//
static void
test_interrupted ()
{
  fixture f ("interrupted");
  string c (content (2500));
  f.object (c).cut_after = 1200;

  assert (f.fail () == transfer_error_kind::transport);
  assert (fs::file_size (f.partial ()) == 1200);
  assert (f.progress.downloaded_bytes == 1200 && !f.progress.completed);

  assert (f.run () == transfer_status::done);
  assert (f.client.offsets.size () == 2 && f.client.offsets[1] == 1200);
  assert (read_file (f.output ()) == c);
}

// Without resume the partial file is discarded.
//
static void
test_no_resume ()
{
  fixture f ("no-resume", false);
  string c (content (2500));
  f.object (c);
  write_file (f.partial (), content (1000, 'z'));

  assert (f.run () == transfer_status::done);
  assert (f.client.offsets[0] == 0);
  assert (read_file (f.output ()) == c);
}

// Without a size the result must be bigger than an error page.
//
static void
test_unknown_size ()
{
  {
    fixture f ("unknown-small");
    f.object (content (500)).head_size = false;

    assert (f.fail () == transfer_error_kind::integrity);
    assert (!fs::exists (f.output ()));
    assert (!fs::exists (f.partial ()));
    assert (!f.progress.completed && !f.progress.total_bytes);
  }

  {
    fixture f ("unknown-large");
    fake_object& o (f.object (content (5000)));
    o.head_size = false;
    o.head_status = http_status::forbidden; // HEAD refused, GET fine.

    assert (f.run () == transfer_status::done);
    assert (f.progress.completed && f.progress.downloaded_bytes == 5000);
    assert (!f.progress.total_bytes);
  }

  // A total remembered from an earlier run doesn't outlive a probe that
  // can no longer tell.
  //
  {
    fixture f ("unknown-stale");
    f.object (content (5000)).head_size = false;
    f.progress.total_bytes = 100;

    assert (f.run () == transfer_status::done);
    assert (!f.progress.total_bytes);
  }
}

// A zero Content-Length means we don't know the size, not that there is
// nothing to fetch.
//
static void
test_zero_length ()
{
  {
    fixture f ("zero-length");
    string c (content (2000));
    f.object (c).head_length = 0;

    assert (f.run () == transfer_status::done);
    assert (f.client.gets == 1);
    assert (read_file (f.output ()) == c);
    assert (f.progress.completed && f.progress.downloaded_bytes == 2000);
    assert (!f.progress.total_bytes);
  }

  // And a partial file is resumed rather than taken as too long.
  //
  {
    fixture f ("zero-length-partial");
    string c (content (2000));
    f.object (c).head_length = 0;
    write_file (f.partial (), c.substr (0, 700));

    assert (f.run () == transfer_status::done);
    assert (f.client.offsets[0] == 700);
    assert (read_file (f.output ()) == c);
  }
}

// A server that answers a range request with the whole content makes us
// drop the partial and start over.
//
static void
test_range_ignored ()
{
  fixture f ("range-ignored");
  string c (content (2500));
  f.object (c).honor_range = false;
  write_file (f.partial (), c.substr (0, 1000));

  assert (f.fail () == transfer_error_kind::protocol);
  assert (!fs::exists (f.partial ()));

  assert (f.run () == transfer_status::done);
  assert (f.client.offsets.back () == 0);
  assert (read_file (f.output ()) == c);
}

// A ranged answer that doesn't start at our offset must not be appended.
//
static void
test_range_misaligned ()
{
  fixture f ("range-misaligned");
  string c (content (2500));
  f.object (c).range_skew = 100;
  write_file (f.partial (), c.substr (0, 1000));

  assert (f.fail () == transfer_error_kind::protocol);
  assert (!fs::exists (f.partial ()));
  assert (!fs::exists (f.output ()));
  assert (f.progress.downloaded_bytes == 0);

  // Starting over needs no range so the skew no longer matters.
  //
  assert (f.run () == transfer_status::done);
  assert (f.client.offsets.back () == 0);
  assert (read_file (f.output ()) == c);
}

static void
test_not_found ()
{
  fixture f ("not-found");

  assert (f.fail () == transfer_error_kind::protocol);
  assert (!fs::exists (f.output ()));
}

static void
test_cancelled ()
{
  fixture f ("cancelled");
  f.object (content (2500));
  f.cancel = true;

  assert (f.fail () == transfer_error_kind::cancelled);
  assert (f.client.heads == 0);
}

int
main ()
{
  test_fresh ();
  test_skip ();
  test_corrupt ();
  test_resume ();
  test_overlong_partial ();
  test_complete_partial ();
  test_interrupted ();
  test_no_resume ();
  test_unknown_size ();
  test_zero_length ();
  test_range_ignored ();
  test_range_misaligned ();
  test_not_found ();
  test_cancelled ();
}
