#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <bulkfetch/http/http-types.hxx>

namespace bulkfetch
{
  // HTTP response head.
  //
  // We never buffer bodies in memory (probes have none and transfers are
  // streamed), so this is just the status line and headers.
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_status  status {http_status::ok};
    string_type  reason;
    headers_type headers;

    basic_http_response () = default;

    explicit
    basic_http_response (http_status s)
      : status (s) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    // Content length in bytes if the header is present and holds a valid
    // non-negative integer, nullopt otherwise.
    //
    std::optional<std::uint64_t>
    content_length () const;

    // First byte position of a Content-Range of the form
    // "bytes <first>-<last>/<total>", nullopt if absent or malformed.
    //
    std::optional<std::uint64_t>
    range_start () const;

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }
  };

  template <typename S>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_response<S>& r)
  {
    o << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string>;
}

#include <bulkfetch/http/http-response.ixx>
