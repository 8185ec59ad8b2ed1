#include <cstddef>
#include <ostream>
#include <sstream>
#include <iomanip>

namespace bulkfetch
{
  // Write v scaled to the largest IEC unit that keeps it at or above one,
  // with one decimal except for plain bytes.
  //
  inline void
  write_iec (std::ostream& o, double v, const char* suffix)
  {
    static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    std::size_t u (0);
    for (; v >= 1024.0 && u + 1 != sizeof (units) / sizeof (units[0]); ++u)
      v /= 1024.0;

    o << std::fixed << std::setprecision (u == 0 ? 0 : 1) << v << ' '
      << units[u] << suffix;
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t n)
  {
    std::ostringstream o;
    write_iec (o, static_cast<double> (n), "");
    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (float bps)
  {
    std::ostringstream o;
    write_iec (o, bps < 0.0f ? 0.0 : static_cast<double> (bps), "/s");
    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int s)
  {
    std::ostringstream o;

    int h (s / 3600);
    int m ((s % 3600) / 60);
    int sec (s % 60);

    if (h > 0)
      o << h << "h";

    o << std::setfill ('0') << std::setw (2) << m << "m"
      << std::setw (2) << sec << "s";

    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float p, bool ind, int w)
  {
    std::ostringstream o;
    o << "[";

    if (ind)
    {
      o << " <==> ";
      for (int i (6); i < w; ++i)
        o << ' ';
    }
    else
    {
      int filled (static_cast<int> (p * w));

      for (int i (0); i < w; ++i)
      {
        if (i < filled - 1)
          o << '=';
        else if (i == filled - 1)
          o << '>';
        else
          o << ' ';
      }
    }

    o << "]";
    return o.str ();
  }

  template <typename T>
  void basic_progress_tracker<T>::
  update (std::uint64_t n) noexcept
  {
    std::uint64_t t (current_time_us ());
    std::uint64_t t0 (last_update_time_.load (std::memory_order_relaxed));

    // Recalculating on every chunk is noisy. Only take a sample once enough
    // time has passed since the last one.
    //
    std::uint64_t dt (t - t0);

    if (t0 != 0 && dt < traits_type::min_update_interval_ms * 1000)
      return;

    std::uint64_t n0 (last_bytes_.load (std::memory_order_relaxed));

    float inst (0.0f);
    if (t0 != 0 && dt > 0)
    {
      std::uint64_t dn (n > n0 ? n - n0 : 0);
      inst = static_cast<float> (dn) /
             (static_cast<float> (dt) / 1000000.0f);
    }

    float s0 (speed_.load (std::memory_order_relaxed));
    float s (s0 == 0.0f
             ? inst
             : traits_type::ewma_alpha * inst +
               (1.0f - traits_type::ewma_alpha) * s0);

    last_bytes_.store (n, std::memory_order_relaxed);
    last_update_time_.store (t, std::memory_order_relaxed);
    speed_.store (s, std::memory_order_relaxed);
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset () noexcept
  {
    last_bytes_.store (0, std::memory_order_relaxed);
    last_update_time_.store (0, std::memory_order_relaxed);
    speed_.store (0.0f, std::memory_order_relaxed);
  }
}
