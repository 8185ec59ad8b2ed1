#include <bulkfetch/http/http-types.hxx>

#include <stdexcept>

using namespace std;

namespace bulkfetch
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return "GET";
      case http_method::head:    return "HEAD";
      case http_method::connect: return "CONNECT";
    }
    return "GET";
  }

  // http_status
  //
  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::no_content:            return "No Content";
      case http_status::partial_content:       return "Partial Content";

      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";

      case http_status::bad_request:           return "Bad Request";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::request_timeout:       return "Request Timeout";
      case http_status::range_not_satisfiable: return "Range Not Satisfiable";
      case http_status::too_many_requests:     return "Too Many Requests";

      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "Unknown";
  }

  // url_parts
  //
  string url_parts::
  authority () const
  {
    bool def ((scheme == "https" && port == "443") ||
              (scheme == "http"  && port == "80"));

    return def ? host : host + ':' + port;
  }

  // Parse a URL into its components.
  //
  // Note that this handles the scheme://host:port/path form we see in
  // catalogs and redirects, not IPv6 literals or user info.
  //
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    if (size_t p = url.find ("://"); p != string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    for (char& c: r.scheme)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    // The authority ends at the start of the path or query.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));

    if (size_t c = auth.find (':'); c != string::npos)
    {
      r.host = auth.substr (0, c);
      r.port = auth.substr (c + 1);
    }
    else
      r.host = auth;

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    if (r.host.empty ())
      throw invalid_argument ("invalid URL '" + url + "': missing host");

    if (end < url.size ())
    {
      r.target = url.substr (end);

      // "http://host?q" is "/?q" on the wire.
      //
      if (r.target[0] != '/')
        r.target.insert (0, 1, '/');

      // Fragments never go to the server.
      //
      if (size_t h = r.target.find ('#'); h != string::npos)
        r.target.resize (h);
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts b (parse_url (base));
    string origin (b.scheme + "://" + b.authority ());

    // Scheme-relative (//host/path).
    //
    if (loc.size () > 1 && loc[0] == '/' && loc[1] == '/')
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return origin + loc;

    // Relative to the directory of the original target.
    //
    string dir (b.target.substr (0, b.target.find ('?')));
    dir.resize (dir.rfind ('/') + 1);

    return origin + dir + loc;
  }
}
