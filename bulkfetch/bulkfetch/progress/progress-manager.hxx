#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ostream>

#include <boost/asio.hpp>

#include <bulkfetch/progress/progress-types.hxx>
#include <bulkfetch/progress/progress-tracker.hxx>
#include <bulkfetch/progress/progress-renderer.hxx>

namespace bulkfetch
{
  namespace asio = boost::asio;

  template <typename S = std::string>
  struct progress_manager_traits
  {
    using string_type = S;

    // Render interval in milliseconds.
    //
    static constexpr int render_interval_ms = 200;
  };

  template <typename T = progress_manager_traits<>>
  class basic_progress_entry
  {
  public:
    using traits_type  = T;
    using string_type  = typename traits_type::string_type;
    using tracker_type =
      basic_progress_tracker<progress_tracker_traits<string_type>>;

    explicit
    basic_progress_entry (string_type label): label_ (std::move (label)) {}

    const string_type&
    label () const noexcept
    {
      return label_;
    }

    progress_metrics&
    metrics () noexcept
    {
      return metrics_;
    }

    const progress_metrics&
    metrics () const noexcept
    {
      return metrics_;
    }

    tracker_type&
    tracker () noexcept
    {
      return tracker_;
    }

    progress_snapshot
    snapshot () const
    {
      return progress_snapshot (metrics_);
    }

    // Update the byte counters, the speed estimate, and the state.
    //
    void
    update (std::uint64_t current, std::uint64_t total) noexcept;

  private:
    string_type label_;
    progress_metrics metrics_;
    tracker_type tracker_;
  };

  // Periodically redraws the in-flight items and a batch summary.
  //
  // All member functions must be called on the io_context thread; the
  // render loop runs there as well.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_manager
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using entry_type    = basic_progress_entry<traits_type>;
    using renderer_type =
      basic_progress_renderer<progress_renderer_traits<string_type>>;
    using context_type  = basic_progress_render_context<string_type>;

    basic_progress_manager (asio::io_context& ioc,
                            std::ostream& os,
                            std::size_t total_count);

    basic_progress_manager (const basic_progress_manager&) = delete;
    basic_progress_manager& operator= (const basic_progress_manager&) =
      delete;

    void
    start ();

    // Draw the final frame and stop the render loop. The loop notices on
    // its next wakeup so the io_context must keep running until then.
    //
    void
    stop ();

    bool
    running () const noexcept
    {
      return running_.load (std::memory_order_relaxed);
    }

    std::shared_ptr<entry_type>
    add_entry (string_type label);

    // Retire an entry, counting it as completed or failed.
    //
    void
    remove_entry (const std::shared_ptr<entry_type>&, bool failed);

    void
    add_log (string_type message);

    context_type
    collect_context () const;

  private:
    asio::awaitable<void>
    render_loop ();

  private:
    asio::io_context& ioc_;
    asio::steady_timer timer_;
    renderer_type renderer_;

    std::atomic<bool> running_ {false};

    std::vector<std::shared_ptr<entry_type>> entries_;
    std::deque<string_type> logs_;

    std::size_t total_count_;
    std::size_t completed_count_ {0};
    std::size_t failed_count_ {0};

    // Bytes of entries that completed and were retired.
    //
    std::uint64_t retired_bytes_ {0};
  };

  using progress_entry   = basic_progress_entry<>;
  using progress_manager = basic_progress_manager<>;
}

#include <bulkfetch/progress/progress-manager.txx>
