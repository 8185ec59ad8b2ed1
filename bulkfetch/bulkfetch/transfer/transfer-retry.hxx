#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <cstddef>
#include <type_traits>

#include <boost/asio.hpp>

#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>

namespace bulkfetch
{
  namespace asio = boost::asio;

  struct retry_policy
  {
    // Total number of attempts, including the first one.
    //
    std::size_t attempts = 3;

    std::chrono::milliseconds base_delay {1000};
    std::chrono::milliseconds max_delay {30000};

    // Whether a size mismatch is worth another attempt. It usually is: the
    // bad file is deleted so the next attempt starts from scratch.
    //
    bool retry_integrity = true;

    // Delay before the attempt that follows the given (1-based) failed
    // attempt: base * 2^(attempt - 1), capped at max_delay.
    //
    std::chrono::milliseconds
    delay (std::size_t attempt) const noexcept;

    bool
    retryable (transfer_error_kind) const noexcept;
  };

  // Run an operation with bounded retries and exponential backoff.
  //
  class retry_controller
  {
  public:
    retry_controller (asio::any_io_executor ex,
                      const retry_policy& policy,
                      transfer_observer& observer,
                      const std::atomic<bool>& cancel)
      : executor_ (std::move (ex)),
        policy_ (policy),
        observer_ (observer),
        cancel_ (cancel) {}

    // Call f(attempt) until it succeeds, fails with a non-retryable error,
    // or the attempts run out, in which case the last error is rethrown.
    // The function should return asio::awaitable<R>.
    //
    template <typename F>
    auto
    run (const std::string& name, F f)
      -> std::invoke_result_t<F&, std::size_t>;

    const retry_policy&
    policy () const noexcept
    {
      return policy_;
    }

  private:
    // Sleep for d, waking up early (and throwing) on cancellation.
    //
    asio::awaitable<void>
    backoff (std::chrono::milliseconds d);

  private:
    asio::any_io_executor executor_;
    retry_policy policy_;
    transfer_observer& observer_;
    const std::atomic<bool>& cancel_;
  };
}

#include <bulkfetch/transfer/transfer-retry.txx>
