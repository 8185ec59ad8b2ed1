#pragma once

#include <atomic>
#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>
#include <type_traits>

#include <boost/asio.hpp>

#include <bulkfetch/http/http-client.hxx>
#include <bulkfetch/catalog/catalog-types.hxx>
#include <bulkfetch/state/state-types.hxx>
#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>

namespace bulkfetch
{
  namespace fs   = std::filesystem;
  namespace asio = boost::asio;

  // The client must provide:
  //
  //   awaitable<response_type> head (url)
  //   awaitable<download_type> download (url, chunk_sink, offset, head_hook)
  //
  // Where response_type has is_success(), status, and content_length().
  //
  template <typename C = http_client>
  struct transfer_traits
  {
    using client_type = C;

    // With no expected size to compare against, a file this small or
    // smaller is assumed to be an error page rather than the content.
    //
    static constexpr std::uint64_t min_unknown_size = 1024;

    static constexpr const char* partial_suffix = ".part";
  };

  // One attempt at bringing a catalog entry to a verified output file.
  //
  // The attempt goes probe, reconcile, fetch (appending to <name>.part and
  // resuming from its length), finalize (rename and verify). The progress
  // record passed in is updated as we go, including on failure.
  //
  // Blocking file system work runs on the files executor so that it doesn't
  // hold up other transfers.
  //
  template <typename T = transfer_traits<>>
  class basic_transfer_task
  {
  public:
    using traits_type   = T;
    using client_type   = typename traits_type::client_type;
    using response_type = typename client_type::response_type;

    basic_transfer_task (client_type& client,
                         asio::any_io_executor files,
                         fs::path output_dir,
                         bool resume,
                         transfer_observer& observer,
                         const std::atomic<bool>& cancel)
      : client_ (client),
        files_ (std::move (files)),
        dir_ (std::move (output_dir)),
        resume_ (resume),
        observer_ (observer),
        cancel_ (cancel) {}

    // Return done or skipped, or throw (usually transfer_error).
    //
    asio::awaitable<transfer_status>
    run (const catalog_entry&, transfer_progress&);

    fs::path
    output_path (const catalog_entry& e) const
    {
      return dir_ / e.name;
    }

    fs::path
    partial_path (const catalog_entry& e) const
    {
      fs::path p (dir_ / e.name);
      p += traits_type::partial_suffix;
      return p;
    }

  private:
    // Expected size or nullopt if the server won't tell.
    //
    asio::awaitable<std::optional<std::uint64_t>>
    probe (const catalog_entry&);

    asio::awaitable<void>
    fetch (const catalog_entry&,
           const fs::path& partial,
           std::uint64_t offset,
           std::optional<std::uint64_t> expected,
           transfer_progress&);

    asio::awaitable<transfer_status>
    finalize (const catalog_entry&,
              const fs::path& partial,
              const fs::path& output,
              std::optional<std::uint64_t> expected,
              transfer_progress&);

    // Run f() on the files executor and return its result.
    //
    template <typename F>
    auto
    blocking (F f) -> asio::awaitable<std::invoke_result_t<F&>>;

    void
    check_cancel () const;

  private:
    client_type& client_;
    asio::any_io_executor files_;
    fs::path dir_;
    bool resume_;
    transfer_observer& observer_;
    const std::atomic<bool>& cancel_;
  };

  using transfer_task = basic_transfer_task<>;
}

#include <bulkfetch/transfer/transfer-task.txx>
