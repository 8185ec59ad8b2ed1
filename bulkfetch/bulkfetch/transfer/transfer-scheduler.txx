#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace bulkfetch
{
  template <typename T>
  asio::awaitable<transfer_summary> basic_transfer_scheduler<T>::
  run (const catalog& c, state_store& store)
  {
    transfer_summary r;
    r.outcomes.resize (c.size ());

    if (c.empty ())
      co_return r;

    admission_gate g (ioc_.get_executor (), options_.concurrency);
    gate_ = &g;

    if (cancel_.load ())
      g.close ();

    // Spawn everything up front and let the gate do the pacing. Since the
    // spawns run in order and the gate is FIFO, entries are admitted in
    // catalog order.
    //
    std::size_t pending (c.size ());
    asio::steady_timer done (ioc_, asio::steady_timer::time_point::max ());

    for (std::size_t i (0); i != c.size (); ++i)
    {
      const catalog_entry& e (c[i]);

      r.outcomes[i].entry = e;

      transfer_progress p (
        store.find (e.name).value_or (transfer_progress (e.name)));

      asio::co_spawn (
        ioc_,
        run_entry (g, e, std::move (p), store),
        [&r, &pending, &done, i] (std::exception_ptr x, transfer_outcome o)
        {
          // run_entry() reports its own failures so this is something
          // unexpected, like bad_alloc.
          //
          if (x)
          {
            r.outcomes[i].status = transfer_status::failed;
            r.outcomes[i].error = error_message (x);
          }
          else
            r.outcomes[i] = std::move (o);

          if (--pending == 0)
            done.cancel ();
        });
    }

    // Wait for the last completion to wake us up.
    //
    if (pending != 0)
    {
      boost::system::error_code ec;
      co_await done.async_wait (asio::redirect_error (asio::use_awaitable,
                                                      ec));
    }

    gate_ = nullptr;

    for (const transfer_outcome& o: r.outcomes)
    {
      if (o.succeeded ())
        ++r.succeeded;
      else if (o.status == transfer_status::cancelled)
        ++r.cancelled;
      else
        ++r.failed;
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<transfer_outcome> basic_transfer_scheduler<T>::
  run_entry (admission_gate& g,
             const catalog_entry& e,
             transfer_progress p,
             state_store& store)
  {
    transfer_outcome o;
    o.entry = e;

    std::exception_ptr x;
    try
    {
      admission_gate::slot s (co_await g.admit ());

      task_type t (client_,
                   files_,
                   options_.output_dir,
                   options_.resume,
                   observer_,
                   cancel_);

      retry_controller rc (ioc_.get_executor (),
                           options_.retry,
                           observer_,
                           cancel_);

      o.status = co_await rc.run (
        e.name,
        [&] (std::size_t a) -> asio::awaitable<transfer_status>
        {
          o.attempts = a;
          co_return co_await t.run (e, p);
        });
    }
    catch (const std::exception&)
    {
      x = std::current_exception ();
    }

    if (x)
    {
      switch (classify_error (x))
      {
      case transfer_error_kind::integrity:
        o.status = transfer_status::mismatch;
        break;
      case transfer_error_kind::cancelled:
        o.status = transfer_status::cancelled;
        break;
      default:
        o.status = transfer_status::failed;
        break;
      }

      o.error = error_message (x);
    }

    // Record whatever we got to, success or not.
    //
    o.progress = p;
    store.merge (p);

    observer_.finished (o);
    co_return o;
  }

  template <typename T>
  void basic_transfer_scheduler<T>::
  cancel () noexcept
  {
    cancel_.store (true);

    if (gate_ != nullptr)
      gate_->close ();
  }
}
