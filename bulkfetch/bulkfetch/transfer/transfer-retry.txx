#include <exception>

namespace bulkfetch
{
  template <typename F>
  auto retry_controller::
  run (const std::string& name, F f)
    -> std::invoke_result_t<F&, std::size_t>
  {
    for (std::size_t a (1);; ++a)
    {
      if (cancel_.load ())
        throw transfer_error (transfer_error_kind::cancelled, "cancelled");

      // Note: we cannot co_await inside a handler so we carry the exception
      // out of it.
      //
      std::exception_ptr e;
      try
      {
        co_return co_await f (a);
      }
      catch (const std::exception&)
      {
        e = std::current_exception ();
      }

      transfer_error_kind k (classify_error (e));

      if (a >= policy_.attempts || !policy_.retryable (k))
        std::rethrow_exception (e);

      std::chrono::milliseconds d (policy_.delay (a));

      observer_.retry (name,
                       "attempt " + std::to_string (a) + '/' +
                       std::to_string (policy_.attempts) + " failed (" +
                       to_string (k) + "): " + error_message (e) +
                       "; retrying in " + std::to_string (d.count ()) +
                       "ms");

      co_await backoff (d);
    }
  }
}
