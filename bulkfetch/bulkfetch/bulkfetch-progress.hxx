#pragma once

#include <map>
#include <memory>
#include <string>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <optional>

#include <boost/asio.hpp>

#include <bulkfetch/progress/progress-manager.hxx>
#include <bulkfetch/transfer/transfer-types.hxx>
#include <bulkfetch/transfer/transfer-observer.hxx>

namespace bulkfetch
{
  namespace asio = boost::asio;

  enum class verbosity: std::uint16_t
  {
    quiet   = 0, // Errors and the summary only.
    normal  = 1, // Per-entry results and retries.
    verbose = 2  // Every state change and periodic byte counts.
  };

  // Reports transfer progress on the terminal.
  //
  // Interactively we keep a live display of the in-flight entries, with
  // state changes scrolling above it. Otherwise (or with --no-progress) we
  // print plain lines, which is also what ends up in a log file.
  //
  class progress_reporter: public transfer_observer
  {
  public:
    using manager_type = progress_manager;
    using entry_type   = manager_type::entry_type;

    progress_reporter (asio::io_context& ioc,
                       std::ostream& os,
                       std::size_t total,
                       verbosity v,
                       bool interactive);

    progress_reporter (const progress_reporter&) = delete;
    progress_reporter& operator= (const progress_reporter&) = delete;

    void
    start ();

    void
    stop ();

    void
    status (const std::string& name, const std::string& message) override;

    void
    retry (const std::string& name, const std::string& message) override;

    void
    bytes (const std::string& name,
           std::uint64_t downloaded,
           std::optional<std::uint64_t> total) override;

    void
    finished (const transfer_outcome&) override;

  private:
    std::shared_ptr<entry_type>
    entry (const std::string& name);

    void
    line (const std::string&);

  private:
    std::ostream& os_;
    verbosity verbosity_;

    // Only in the interactive mode.
    //
    std::unique_ptr<manager_type> manager_;
    std::map<std::string, std::shared_ptr<entry_type>> entries_;

    // Last time we printed a byte count for an entry (plain verbose mode).
    //
    std::map<std::string, std::chrono::steady_clock::time_point> printed_;
  };

  // Return true if stdout is a terminal we can redraw.
  //
  bool
  stdout_fancy ();
}
