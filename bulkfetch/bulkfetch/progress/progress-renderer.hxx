#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <bulkfetch/progress/progress-types.hxx>
#include <bulkfetch/progress/progress-tracker.hxx>

namespace bulkfetch
{
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    static constexpr int default_bar_width = 20;

    static constexpr std::size_t max_log_messages = 5;

    // Rows of in-flight items; the rest are summarized in one line.
    //
    static constexpr std::size_t max_items = 16;

    static ftxui::Element
    render_item (const string_type& label,
                 const progress_snapshot&,
                 int bar_width = default_bar_width);

    static ftxui::Element
    render_summary (std::size_t completed,
                    std::size_t failed,
                    std::size_t total,
                    const progress_snapshot& overall);

    static ftxui::Element
    render_logs (const std::vector<string_type>& messages);
  };

  template <typename S = std::string>
  struct basic_progress_item
  {
    using string_type = S;

    string_type label;
    progress_snapshot snapshot;

    basic_progress_item () = default;

    basic_progress_item (string_type l, progress_snapshot s)
      : label (std::move (l)), snapshot (s) {}
  };

  template <typename S = std::string>
  struct basic_progress_render_context
  {
    using string_type = S;
    using item_type   = basic_progress_item<string_type>;

    std::vector<item_type> items;
    progress_snapshot overall;
    std::vector<string_type> log_messages;

    std::size_t completed_count {0};
    std::size_t failed_count {0};
    std::size_t total_count {0};
  };

  // Draws frames onto a terminal, each one over the previous.
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type  = T;
    using string_type  = typename traits_type::string_type;
    using context_type = basic_progress_render_context<string_type>;

    explicit
    basic_progress_renderer (std::ostream& os): os_ (os) {}

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) =
      delete;

    void
    draw (const context_type&);

    // Leave the last frame where it is and continue below it.
    //
    void
    finish ();

    ftxui::Element
    compose (const context_type&) const;

  private:
    std::ostream& os_;

    // Escape sequence that takes the cursor back to the top of the last
    // frame (and clears it).
    //
    std::string reset_;
  };

  using progress_item = basic_progress_item<>;
  using progress_render_context = basic_progress_render_context<>;
  using progress_renderer = basic_progress_renderer<>;
}

#include <bulkfetch/progress/progress-renderer.txx>
