#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <vector>
#include <stdexcept>

namespace bulkfetch
{
  // HTTP method (verb).
  //
  // We only speak the handful of verbs a fetcher needs: HEAD to probe, GET to
  // transfer, and CONNECT to tunnel TLS through a proxy.
  //
  enum class http_method
  {
    get,
    head,
    connect
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes we act upon are named. Anything else the server sends is
  // still representable since the underlying type is the raw code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    forbidden             = 403,
    not_found             = 404,
    request_timeout       = 408,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Thrown when the exchange itself succeeded but the server's answer is not
  // something we can work with (redirect loops, a refused proxy tunnel, etc).
  //
  class http_protocol_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Thrown when the server answers with a status we cannot use.
  //
  class http_status_error: public http_protocol_error
  {
  public:
    http_status_error (http_status s, const std::string& url)
      : http_protocol_error ("HTTP request failed: " +
                             std::to_string (static_cast<std::uint16_t> (s)) +
                             ' ' + to_string (s) + " [url: " + url + "]"),
        status (s)
    {
    }

    http_status status;
  };

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection.
  //
  // Names are compared case-insensitively (RFC 7230) but stored as given.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Return the first value for the name or nullopt if there is none.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // Absolute URL split into the parts we need to open a connection.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // Value for the Host header: the port is only spelled out when it is not
    // the scheme's default.
    //
    std::string
    authority () const;
  };

  // Parse an absolute URL (scheme://host[:port][/target]). A missing scheme
  // defaults to http and a missing target to "/". Throw invalid_argument if
  // there is no host.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a redirect Location against the URL that produced it. Absolute
  // locations are returned as is, absolute paths are grafted onto the
  // original authority.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);
}

#include <bulkfetch/http/http-types.ixx>
