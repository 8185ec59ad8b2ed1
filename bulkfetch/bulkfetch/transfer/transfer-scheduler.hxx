#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>

#include <boost/asio.hpp>

#include <bulkfetch/catalog/catalog-types.hxx>
#include <bulkfetch/state/state-store.hxx>
#include <bulkfetch/transfer/transfer-gate.hxx>
#include <bulkfetch/transfer/transfer-task.hxx>
#include <bulkfetch/transfer/transfer-retry.hxx>
#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>

namespace bulkfetch
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  struct transfer_options
  {
    fs::path output_dir;

    // Maximum number of entries in flight at once.
    //
    std::size_t concurrency = 4;

    bool resume = true;

    retry_policy retry;
  };

  // Run a batch of transfers with bounded concurrency.
  //
  // Entries are admitted in catalog order, each one retried on its own, and
  // one entry's failure never affects another. Progress is merged into the
  // store as each entry reaches its final status.
  //
  template <typename T = transfer_traits<>>
  class basic_transfer_scheduler
  {
  public:
    using traits_type = T;
    using client_type = typename traits_type::client_type;
    using task_type   = basic_transfer_task<traits_type>;

    // The scheduler coroutines run on ioc (which must be driven by a single
    // thread), file system work on the files executor.
    //
    basic_transfer_scheduler (asio::io_context& ioc,
                              client_type& client,
                              asio::any_io_executor files,
                              transfer_options options,
                              transfer_observer& observer)
      : ioc_ (ioc),
        client_ (client),
        files_ (std::move (files)),
        options_ (std::move (options)),
        observer_ (observer) {}

    basic_transfer_scheduler (const basic_transfer_scheduler&) = delete;
    basic_transfer_scheduler& operator= (const basic_transfer_scheduler&) =
      delete;

    asio::awaitable<transfer_summary>
    run (const catalog&, state_store&);

    // Request a shutdown: waiting entries are not admitted, running ones
    // stop at their next suspension point. Must be called on the ioc thread.
    //
    void
    cancel () noexcept;

    bool
    cancelled () const noexcept
    {
      return cancel_.load ();
    }

    const transfer_options&
    options () const noexcept
    {
      return options_;
    }

  private:
    asio::awaitable<transfer_outcome>
    run_entry (admission_gate&,
               const catalog_entry&,
               transfer_progress,
               state_store&);

  private:
    asio::io_context& ioc_;
    client_type& client_;
    asio::any_io_executor files_;
    transfer_options options_;
    transfer_observer& observer_;

    std::atomic<bool> cancel_ {false};
    admission_gate* gate_ = nullptr;
  };

  using transfer_scheduler = basic_transfer_scheduler<>;
}

#include <bulkfetch/transfer/transfer-scheduler.txx>
