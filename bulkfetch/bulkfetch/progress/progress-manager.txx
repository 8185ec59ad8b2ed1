#include <chrono>
#include <algorithm>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace bulkfetch
{
  template <typename T>
  void basic_progress_entry<T>::
  update (std::uint64_t c, std::uint64_t t) noexcept
  {
    metrics_.current_bytes.store (c, std::memory_order_relaxed);
    metrics_.total_bytes.store (t, std::memory_order_relaxed);

    tracker_.update (c);
    metrics_.speed.store (tracker_.speed (), std::memory_order_relaxed);

    metrics_.state.store (t != 0 && c >= t
                          ? progress_state::completed
                          : progress_state::active,
                          std::memory_order_relaxed);
  }

  template <typename T>
  basic_progress_manager<T>::
  basic_progress_manager (asio::io_context& ioc,
                          std::ostream& os,
                          std::size_t total_count)
    : ioc_ (ioc),
      timer_ (ioc),
      renderer_ (os),
      total_count_ (total_count)
  {
  }

  template <typename T>
  void basic_progress_manager<T>::
  start ()
  {
    if (running_.exchange (true, std::memory_order_relaxed))
      return;

    asio::co_spawn (ioc_, render_loop (), asio::detached);
  }

  template <typename T>
  void basic_progress_manager<T>::
  stop ()
  {
    if (!running_.exchange (false, std::memory_order_relaxed))
      return;

    timer_.cancel ();

    renderer_.draw (collect_context ());
    renderer_.finish ();
  }

  template <typename T>
  std::shared_ptr<typename basic_progress_manager<T>::entry_type>
  basic_progress_manager<T>::
  add_entry (string_type l)
  {
    auto e (std::make_shared<entry_type> (std::move (l)));
    entries_.push_back (e);
    return e;
  }

  template <typename T>
  void basic_progress_manager<T>::
  remove_entry (const std::shared_ptr<entry_type>& e, bool failed)
  {
    auto i (std::find (entries_.begin (), entries_.end (), e));
    if (i == entries_.end ())
      return;

    if (failed)
      ++failed_count_;
    else
    {
      ++completed_count_;
      retired_bytes_ += e->metrics ().current_bytes.load (
        std::memory_order_relaxed);
    }

    entries_.erase (i);
  }

  template <typename T>
  void basic_progress_manager<T>::
  add_log (string_type m)
  {
    logs_.push_back (std::move (m));

    while (logs_.size () >
           progress_renderer_traits<string_type>::max_log_messages)
      logs_.pop_front ();
  }

  template <typename T>
  typename basic_progress_manager<T>::context_type
  basic_progress_manager<T>::
  collect_context () const
  {
    context_type c;
    c.total_count = total_count_;
    c.completed_count = completed_count_;
    c.failed_count = failed_count_;
    c.log_messages.assign (logs_.begin (), logs_.end ());

    std::uint64_t cur (retired_bytes_);
    float speed (0.0f);

    for (const auto& e: entries_)
    {
      progress_snapshot s (e->snapshot ());

      cur += s.current_bytes;
      speed += s.speed;

      c.items.emplace_back (e->label (), s);
    }

    // The overall total is unknown as long as some entries haven't been
    // probed, so we only report the running byte count and speed.
    //
    c.overall.current_bytes = cur;
    c.overall.speed = speed;
    c.overall.state = progress_state::active;

    return c;
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  render_loop ()
  {
    while (running ())
    {
      renderer_.draw (collect_context ());

      timer_.expires_after (
        std::chrono::milliseconds (traits_type::render_interval_ms));

      boost::system::error_code ec;
      co_await timer_.async_wait (asio::redirect_error (asio::use_awaitable,
                                                        ec));
    }
  }
}
