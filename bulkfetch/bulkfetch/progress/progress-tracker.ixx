namespace bulkfetch
{
  inline std::uint64_t
  current_time_us () noexcept
  {
    using namespace std::chrono;

    auto us (duration_cast<microseconds> (
               steady_clock::now ().time_since_epoch ()));
    return static_cast<std::uint64_t> (us.count ());
  }
}
