#include <bulkfetch/transfer/transfer-retry.hxx>

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>
#include <bulkfetch/transfer/fake-client.test.hxx>

using namespace std;
using namespace bulkfetch;

namespace asio = boost::asio;

using chrono::milliseconds;

class recording_observer: public null_transfer_observer
{
public:
  void
  status (const string& n, const string& m) override
  {
    messages.push_back (n + ": " + m);
  }

  vector<string> messages;
};

static retry_policy
fast (size_t attempts)
{
  retry_policy p;
  p.attempts = attempts;
  p.base_delay = milliseconds (1);
  p.max_delay = milliseconds (4);
  return p;
}

static void
test_delay ()
{
  retry_policy p;

  assert (p.delay (1) == milliseconds (1000));
  assert (p.delay (2) == milliseconds (2000));
  assert (p.delay (3) == milliseconds (4000));
  assert (p.delay (5) == milliseconds (16000));
  assert (p.delay (6) == milliseconds (30000));
  assert (p.delay (100) == milliseconds (30000));
}

static void
test_retryable ()
{
  retry_policy p;

  assert (p.retryable (transfer_error_kind::transport));
  assert (p.retryable (transfer_error_kind::protocol));
  assert (p.retryable (transfer_error_kind::storage));
  assert (p.retryable (transfer_error_kind::integrity));
  assert (!p.retryable (transfer_error_kind::cancelled));

  p.retry_integrity = false;
  assert (!p.retryable (transfer_error_kind::integrity));
}

// Two failures and then success within three attempts.
//
static void
test_recover ()
{
  asio::io_context ioc;
  recording_observer o;
  atomic<bool> cancel (false);

  retry_controller rc (ioc.get_executor (), fast (3), o, cancel);

  size_t calls (0);
  int r (test::run (ioc, rc.run ("b.bin",
    [&calls] (size_t a) -> asio::awaitable<int>
    {
      ++calls;
      if (a < 3)
        throw boost::system::system_error (asio::error::connection_reset);
      co_return 42;
    })));

  assert (r == 42);
  assert (calls == 3);
  assert (o.messages.size () == 2);
  assert (o.messages[0].find ("attempt 1/3") != string::npos);
}

// When the attempts run out the last error is what we get.
//
static void
test_exhaust ()
{
  asio::io_context ioc;
  recording_observer o;
  atomic<bool> cancel (false);

  retry_controller rc (ioc.get_executor (), fast (2), o, cancel);

  size_t calls (0);
  bool thrown (false);
  try
  {
    test::run (ioc, rc.run ("x",
      [&calls] (size_t a) -> asio::awaitable<int>
      {
        ++calls;
        throw transfer_error (transfer_error_kind::protocol,
                              "attempt " + std::to_string (a));
        co_return 0;
      }));
  }
  catch (const transfer_error& e)
  {
    thrown = true;
    assert (string (e.what ()) == "attempt 2");
  }

  assert (thrown && calls == 2);
}

// Integrity failures are final if so configured, cancellation always.
//
static void
test_final ()
{
  asio::io_context ioc;
  recording_observer o;
  atomic<bool> cancel (false);

  retry_policy p (fast (5));
  p.retry_integrity = false;

  retry_controller rc (ioc.get_executor (), p, o, cancel);

  for (transfer_error_kind k: {transfer_error_kind::integrity,
                               transfer_error_kind::cancelled})
  {
    size_t calls (0);
    try
    {
      test::run (ioc, rc.run ("x",
        [&calls, k] (size_t) -> asio::awaitable<int>
        {
          ++calls;
          throw transfer_error (k, "nope");
          co_return 0;
        }));
      assert (false);
    }
    catch (const transfer_error& e)
    {
      assert (e.kind () == k);
    }

    assert (calls == 1);
  }
}

// A cancellation request stops the loop during the backoff.
//
static void
test_cancel ()
{
  asio::io_context ioc;
  recording_observer o;
  atomic<bool> cancel (false);

  retry_policy p;
  p.attempts = 3;
  p.base_delay = milliseconds (10000);

  retry_controller rc (ioc.get_executor (), p, o, cancel);

  asio::steady_timer t (ioc, milliseconds (20));
  t.async_wait ([&cancel] (const boost::system::error_code&)
                {
                  cancel = true;
                });

  size_t calls (0);
  auto start (chrono::steady_clock::now ());
  try
  {
    test::run (ioc, rc.run ("x",
      [&calls] (size_t) -> asio::awaitable<int>
      {
        ++calls;
        throw transfer_error (transfer_error_kind::transport, "down");
        co_return 0;
      }));
    assert (false);
  }
  catch (const transfer_error& e)
  {
    assert (e.kind () == transfer_error_kind::cancelled);
  }

  assert (calls == 1);
  assert (chrono::steady_clock::now () - start < chrono::seconds (5));
}

int
main ()
{
  test_delay ();
  test_retryable ();
  test_recover ();
  test_exhaust ();
  test_final ();
  test_cancel ();
}
