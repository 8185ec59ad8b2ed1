#pragma once

#include <deque>
#include <memory>
#include <cstddef>

#include <boost/asio.hpp>

namespace bulkfetch
{
  namespace asio = boost::asio;

  // Counting admission gate for coroutines.
  //
  // At most N holders at a time; the rest wait in the order they arrived.
  // The gate is not thread-safe: all coroutines using it must run on the
  // same single-threaded executor.
  //
  class admission_gate
  {
  public:
    // Releases its slot on destruction.
    //
    class slot
    {
    public:
      slot () = default;

      explicit
      slot (admission_gate& g) noexcept: gate_ (&g) {}

      slot (slot&& x) noexcept: gate_ (x.gate_) {x.gate_ = nullptr;}

      slot&
      operator= (slot&& x) noexcept
      {
        if (this != &x)
        {
          reset ();
          gate_ = x.gate_;
          x.gate_ = nullptr;
        }
        return *this;
      }

      slot (const slot&) = delete;
      slot& operator= (const slot&) = delete;

      ~slot () {reset ();}

      void
      reset () noexcept
      {
        if (gate_ != nullptr)
        {
          gate_->release ();
          gate_ = nullptr;
        }
      }

    private:
      admission_gate* gate_ = nullptr;
    };

    admission_gate (asio::any_io_executor ex, std::size_t slots);

    admission_gate (const admission_gate&) = delete;
    admission_gate& operator= (const admission_gate&) = delete;

    // Wait for a free slot and return it. Throw transfer_error (cancelled)
    // if the gate is or gets closed before a slot is handed over.
    //
    asio::awaitable<slot>
    admit ();

    // Give a slot back, handing it directly to the longest waiter if any.
    //
    void
    release () noexcept;

    // Wake up all waiters with a cancellation and refuse further admissions.
    //
    void
    close () noexcept;

    std::size_t
    available () const noexcept
    {
      return available_;
    }

    std::size_t
    waiting () const noexcept
    {
      return waiters_.size ();
    }

  private:
    struct waiter
    {
      explicit
      waiter (const asio::any_io_executor& ex)
        : timer (ex, asio::steady_timer::time_point::max ()) {}

      asio::steady_timer timer;
      bool granted = false;
    };

    asio::any_io_executor executor_;
    std::size_t available_;
    bool closed_ = false;
    std::deque<std::shared_ptr<waiter>> waiters_;
  };
}
