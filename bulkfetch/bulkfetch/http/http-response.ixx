#include <charconv>

namespace bulkfetch
{
  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v)
      return std::nullopt;

    // Tolerate surrounding whitespace but nothing else: "12abc" is not a
    // length we want to plan a transfer around.
    //
    const char* b (v->data ());
    const char* e (b + v->size ());

    while (b != e && (*b == ' ' || *b == '\t')) ++b;
    while (e != b && (e[-1] == ' ' || e[-1] == '\t')) --e;

    std::uint64_t n (0);
    auto r (std::from_chars (b, e, n));

    if (r.ec == std::errc () && r.ptr == e && b != e)
      return n;

    return std::nullopt;
  }

  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  range_start () const
  {
    auto v (get_header (string_type ("Content-Range")));

    if (!v)
      return std::nullopt;

    const char* b (v->data ());
    const char* e (b + v->size ());

    while (b != e && (*b == ' ' || *b == '\t')) ++b;

    // The unit is case-insensitive but we only ever ask for bytes.
    //
    const char u[] = "bytes";
    for (const char* c (u); *c != '\0'; ++c, ++b)
    {
      if (b == e || (*b | 0x20) != *c)
        return std::nullopt;
    }

    if (b == e || *b != ' ')
      return std::nullopt;

    while (b != e && *b == ' ') ++b;

    std::uint64_t n (0);
    auto r (std::from_chars (b, e, n));

    if (r.ec == std::errc () && r.ptr != e && *r.ptr == '-')
      return n;

    return std::nullopt;
  }
}
