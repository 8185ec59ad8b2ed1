#pragma once

#include <memory>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include <bulkfetch/http/http.hxx>
#include <bulkfetch/state/state-store.hxx>
#include <bulkfetch/catalog/catalog-types.hxx>
#include <bulkfetch/transfer/transfer.hxx>

namespace bulkfetch
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  // Owns everything a batch needs (HTTP client, file I/O pool, progress
  // store, scheduler) and runs it start to finish.
  //
  class transfer_coordinator
  {
  public:
    using scheduler_type = transfer_scheduler;

    // Create the output directory if necessary, which is the first thing
    // that can fail for storage reasons.
    //
    transfer_coordinator (asio::io_context& ioc,
                          const http_client_traits<>& http,
                          transfer_options options,
                          transfer_observer& observer);

    ~transfer_coordinator ();

    transfer_coordinator (const transfer_coordinator&) = delete;
    transfer_coordinator& operator= (const transfer_coordinator&) = delete;

    // Load the progress record, run the batch, save the record. The record
    // is saved even if the run was cancelled.
    //
    asio::awaitable<transfer_summary>
    execute (const catalog&);

    void
    cancel () noexcept;

    state_store&
    store () noexcept
    {
      return store_;
    }

  private:
    asio::thread_pool files_;
    std::unique_ptr<http_client> http_;
    state_store store_;
    bool resume_;
    std::unique_ptr<scheduler_type> scheduler_;
  };
}
