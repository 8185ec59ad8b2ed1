#pragma once

#include <atomic>
#include <cstdint>

namespace bulkfetch
{
  enum class progress_state
  {
    pending,
    active,
    completed,
    failed
  };

  // Live metrics of one item. Written by the transfer, read by the renderer.
  //
  struct progress_metrics
  {
    std::atomic<std::uint64_t> current_bytes {0};
    std::atomic<std::uint64_t> total_bytes {0};   // 0 if unknown.
    std::atomic<float> speed {0.0f};              // Bytes per second.
    std::atomic<progress_state> state {progress_state::pending};
  };

  // Point-in-time copy of progress_metrics.
  //
  struct progress_snapshot
  {
    std::uint64_t current_bytes {0};
    std::uint64_t total_bytes {0};
    float speed {0.0f};
    progress_state state {progress_state::pending};

    progress_snapshot () = default;

    explicit
    progress_snapshot (const progress_metrics& m)
      : current_bytes (m.current_bytes.load (std::memory_order_relaxed)),
        total_bytes (m.total_bytes.load (std::memory_order_relaxed)),
        speed (m.speed.load (std::memory_order_relaxed)),
        state (m.state.load (std::memory_order_relaxed)) {}

    // In [0, 1], 0 if the total is unknown.
    //
    float
    progress_ratio () const noexcept
    {
      if (total_bytes == 0)
        return state == progress_state::completed ? 1.0f : 0.0f;

      if (current_bytes >= total_bytes)
        return 1.0f;

      return static_cast<float> (current_bytes) /
             static_cast<float> (total_bytes);
    }

    // Seconds remaining at the current speed, -1 if we can't tell.
    //
    int
    eta_seconds () const noexcept
    {
      if (total_bytes == 0 || speed <= 0.0f || current_bytes >= total_bytes)
        return -1;

      return static_cast<int> (
        static_cast<float> (total_bytes - current_bytes) / speed);
    }
  };
}
