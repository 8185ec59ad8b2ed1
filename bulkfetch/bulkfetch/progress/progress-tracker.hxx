#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <cstdint>

#include <bulkfetch/progress/progress-types.hxx>

namespace bulkfetch
{
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // Minimum interval between speed recalculations.
    //
    static constexpr std::uint64_t min_update_interval_ms = 200;

    // Weight of the newest sample in the moving average.
    //
    static constexpr float ewma_alpha = 0.3f;

    // 512 B, 1.5 KiB, 3.2 GiB.
    //
    static string_type
    format_bytes (std::uint64_t);

    static string_type
    format_speed (float bytes_per_second);

    // 05m07s, 1h02m00s.
    //
    static string_type
    format_duration (int seconds);

    // [=====>    ] for a known ratio, a fixed marker if indeterminate.
    //
    static string_type
    format_bar (float ratio, bool indeterminate, int width);
  };

  // Transfer speed estimate (exponentially weighted).
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;

    // Record that n bytes have been transferred so far.
    //
    void
    update (std::uint64_t n) noexcept;

    void
    reset () noexcept;

    float
    speed () const noexcept
    {
      return speed_.load (std::memory_order_relaxed);
    }

  private:
    std::atomic<std::uint64_t> last_bytes_ {0};
    std::atomic<std::uint64_t> last_update_time_ {0}; // Microseconds.
    std::atomic<float> speed_ {0.0f};
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <bulkfetch/progress/progress-tracker.ixx>
#include <bulkfetch/progress/progress-tracker.txx>
