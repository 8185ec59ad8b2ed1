#include <bulkfetch/transfer/transfer-gate.hxx>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <bulkfetch/transfer/transfer-types.hxx>

using namespace std;

namespace bulkfetch
{
  admission_gate::
  admission_gate (asio::any_io_executor ex, size_t slots)
    : executor_ (move (ex)), available_ (slots != 0 ? slots : 1)
  {
  }

  asio::awaitable<admission_gate::slot> admission_gate::
  admit ()
  {
    if (closed_)
      throw transfer_error (transfer_error_kind::cancelled, "cancelled");

    if (available_ != 0)
    {
      --available_;
      co_return slot (*this);
    }

    // Park on a timer that never expires on its own. Whoever wakes us up
    // (release() or close()) cancels it.
    //
    auto w (make_shared<waiter> (executor_));
    waiters_.push_back (w);

    boost::system::error_code ec;
    co_await w->timer.async_wait (asio::redirect_error (asio::use_awaitable,
                                                         ec));

    if (!w->granted)
      throw transfer_error (transfer_error_kind::cancelled, "cancelled");

    co_return slot (*this);
  }

  void admission_gate::
  release () noexcept
  {
    if (!waiters_.empty ())
    {
      // The slot passes straight to the waiter; available_ is unchanged.
      //
      shared_ptr<waiter> w (move (waiters_.front ()));
      waiters_.pop_front ();

      w->granted = true;
      w->timer.cancel ();
    }
    else
      ++available_;
  }

  void admission_gate::
  close () noexcept
  {
    closed_ = true;

    for (const shared_ptr<waiter>& w: waiters_)
      w->timer.cancel ();

    waiters_.clear ();
  }
}
