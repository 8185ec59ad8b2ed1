#include <sstream>
#include <iomanip>
#include <algorithm>

namespace bulkfetch
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_item (const string_type& label, const progress_snapshot& s, int w)
  {
    using namespace ftxui;
    using traits = progress_tracker_traits<S>;

    // Without a total we can only show that something is happening.
    //
    bool i (s.total_bytes == 0);
    float p (s.progress_ratio ());
    int pct (static_cast<int> (p * 100));

    // Fixed widths so that the columns don't jitter as the numbers change.
    //
    std::ostringstream r;
    r << std::right << std::setw (4) << pct << "%"
      << " " << traits::format_bar (p, i, w)
      << " | " << std::setw (12) << traits::format_speed (s.speed)
      << " | " << std::setw (10) << traits::format_bytes (s.current_bytes)
      << " | " << std::setw (8);

    int eta (s.eta_seconds ());
    if (eta > 0)
      r << traits::format_duration (eta);
    else
      r << "--m--s";

    Element l (text (label));

    if (s.state == progress_state::failed)
      l = l | color (Color::Red);

    return hbox ({l, filler (), text (r.str ())});
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_summary (std::size_t done,
                  std::size_t failed,
                  std::size_t total,
                  const progress_snapshot& s)
  {
    using namespace ftxui;
    using traits = progress_tracker_traits<S>;

    std::ostringstream l;
    l << "[" << done << "/" << total << "] done";

    if (failed != 0)
      l << ", " << failed << " failed";

    std::ostringstream r;
    r << traits::format_bytes (s.current_bytes)
      << " | " << std::setw (12) << traits::format_speed (s.speed);

    return hbox ({text (l.str ()) | bold, filler (), text (r.str ())});
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_logs (const std::vector<string_type>& msgs)
  {
    using namespace ftxui;

    // An empty vbox is still a box; don't bother.
    //
    if (msgs.empty ())
      return text ("");

    Elements es;
    es.reserve (msgs.size ());

    for (const auto& m: msgs)
      es.push_back (text (m) | dim);

    return vbox (std::move (es));
  }

  template <typename T>
  ftxui::Element basic_progress_renderer<T>::
  compose (const context_type& c) const
  {
    using namespace ftxui;

    Elements es;

    std::size_t n (std::min (c.items.size (), traits_type::max_items));

    for (std::size_t i (0); i != n; ++i)
    {
      const auto& it (c.items[i]);
      es.push_back (traits_type::render_item (it.label, it.snapshot));
    }

    if (n < c.items.size ())
    {
      std::ostringstream s;
      s << "... (" << c.items.size () - n << " more in flight)";
      es.push_back (text (s.str ()) | dim);
    }

    Elements r;

    if (!c.log_messages.empty ())
      r.push_back (traits_type::render_logs (c.log_messages));

    r.push_back (vbox (std::move (es)));
    r.push_back (separator ());
    r.push_back (traits_type::render_summary (c.completed_count,
                                              c.failed_count,
                                              c.total_count,
                                              c.overall));
    return vbox (std::move (r));
  }

  template <typename T>
  void basic_progress_renderer<T>::
  draw (const context_type& c)
  {
    using namespace ftxui;

    Element doc (compose (c));

    Screen screen (Screen::Create (Dimension::Full (), Dimension::Fit (doc)));
    Render (screen, doc);

    os_ << reset_ << screen.ToString () << std::flush;
    reset_ = screen.ResetPosition (true /* clear */);
  }

  template <typename T>
  void basic_progress_renderer<T>::
  finish ()
  {
    if (!reset_.empty ())
    {
      os_ << std::endl;
      reset_.clear ();
    }
  }
}
