#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <bulkfetch/http/http-types.hxx>

namespace bulkfetch
{
  // HTTP request.
  //
  // Requests never carry a body: we only probe and fetch.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method {http_method::get};
    string_type  url;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
        : method (m), url (std::move (u)) {}

    // Request target as it goes on the request line.
    //
    // Through a plain HTTP proxy the target must be the absolute URL, otherwise
    // it is just the path and query.
    //
    string_type
    target (bool absolute = false) const
    {
      return absolute ? url : string_type (parse_url (url).target);
    }

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Ask for the suffix of the content starting at offset. A zero offset
    // means the whole content so no header is sent.
    //
    void
    set_range (std::uint64_t offset);

    // Add the headers HTTP/1.1 requires (Host) and the ones we always send
    // (User-Agent), unless already present.
    //
    void
    normalize (const string_type& user_agent);

    bool
    valid () const noexcept
    {
      return !url.empty ();
    }
  };

  using http_request = basic_http_request<std::string>;
}

#include <bulkfetch/http/http-request.ixx>
