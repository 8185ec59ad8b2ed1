#include <bulkfetch/transfer/transfer-retry.hxx>

#include <algorithm>

#include <boost/asio/use_awaitable.hpp>

using namespace std;
using namespace std::chrono;

namespace bulkfetch
{
  milliseconds retry_policy::
  delay (size_t attempt) const noexcept
  {
    if (attempt == 0)
      attempt = 1;

    // Double until we hit the cap, without overflowing on the way.
    //
    milliseconds d (base_delay);
    for (size_t i (1); i < attempt && d < max_delay; ++i)
      d *= 2;

    return min (d, max_delay);
  }

  bool retry_policy::
  retryable (transfer_error_kind k) const noexcept
  {
    switch (k)
    {
    case transfer_error_kind::cancelled: return false;
    case transfer_error_kind::integrity: return retry_integrity;
    default:                             return true;
    }
  }

  asio::awaitable<void> retry_controller::
  backoff (milliseconds d)
  {
    // Sleep in slices so that a shutdown request doesn't have to wait out a
    // long backoff.
    //
    const milliseconds slice (100);

    asio::steady_timer t (executor_);
    for (steady_clock::time_point end (steady_clock::now () + d);;)
    {
      if (cancel_.load ())
        throw transfer_error (transfer_error_kind::cancelled, "cancelled");

      steady_clock::time_point now (steady_clock::now ());
      if (now >= end)
        break;

      t.expires_after (min (slice, duration_cast<milliseconds> (end - now)));
      co_await t.async_wait (asio::use_awaitable);
    }
  }
}
