#include <bulkfetch/http/http-types.hxx>

#include <cassert>
#include <string>
#include <stdexcept>

#include <bulkfetch/http/http-request.hxx>
#include <bulkfetch/http/http-response.hxx>

using namespace std;
using namespace bulkfetch;

static void
test_parse_url ()
{
  {
    url_parts u (parse_url ("https://dl.example.com/sa_000001.tar?sig=x"));
    assert (u.scheme == "https");
    assert (u.host == "dl.example.com");
    assert (u.port == "443");
    assert (u.target == "/sa_000001.tar?sig=x");
    assert (u.secure ());
    assert (u.authority () == "dl.example.com");
  }

  {
    url_parts u (parse_url ("HTTP://host:8080"));
    assert (u.scheme == "http");
    assert (u.port == "8080");
    assert (u.target == "/");
    assert (u.authority () == "host:8080");
  }

  {
    url_parts u (parse_url ("http://host?q=1#frag"));
    assert (u.target == "/?q=1");
  }

  {
    url_parts u (parse_url ("host/path"));
    assert (u.scheme == "http" && u.host == "host" && u.target == "/path");
  }

  bool thrown (false);
  try
  {
    parse_url ("https:///nohost");
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);
}

static void
test_resolve_location ()
{
  const string b ("https://a.example/dir/file?x=1");

  assert (resolve_location (b, "http://b.example/y") == "http://b.example/y");
  assert (resolve_location (b, "//c.example/z") == "https://c.example/z");
  assert (resolve_location (b, "/root") == "https://a.example/root");
  assert (resolve_location (b, "other") == "https://a.example/dir/other");
}

static void
test_headers ()
{
  http_headers h;
  assert (h.empty ());

  h.set ("Content-Length", "10");
  h.set ("content-length", "20");
  assert (h.fields.size () == 1);
  assert (*h.get ("CONTENT-LENGTH") == "20");

  h.add ("Set-Cookie", "a");
  h.add ("Set-Cookie", "b");
  assert (h.fields.size () == 3);
  assert (*h.get ("set-cookie") == "a");

  h.remove ("SET-COOKIE");
  assert (!h.contains ("Set-Cookie"));
  assert (h.contains ("Content-Length"));
}

static void
test_request ()
{
  http_request r (http_method::get, "https://a.example:8443/f?s=1");
  assert (r.valid ());

  r.normalize ("bulkfetch");
  assert (*r.get_header ("Host") == "a.example:8443");
  assert (*r.get_header ("User-Agent") == "bulkfetch");

  assert (r.target () == "/f?s=1");
  assert (r.target (true) == "https://a.example:8443/f?s=1");

  r.set_range (1000);
  assert (*r.get_header ("Range") == "bytes=1000-");

  r.set_range (0);
  assert (!r.has_header ("Range"));
}

static void
test_response ()
{
  http_response r (http_status::ok);
  assert (r.is_success () && !r.is_redirection ());
  assert (!r.content_length ());

  r.headers.set ("Content-Length", " 12345 ");
  assert (r.content_length () && *r.content_length () == 12345);

  r.headers.set ("Content-Length", "12x");
  assert (!r.content_length ());

  r.headers.set ("Content-Length", "-1");
  assert (!r.content_length ());

  http_response p (http_status::partial_content);
  assert (!p.range_start ());

  p.headers.set ("Content-Range", "bytes 1000-2499/2500");
  assert (p.range_start () && *p.range_start () == 1000);

  p.headers.set ("Content-Range", "Bytes 0-9/*");
  assert (p.range_start () && *p.range_start () == 0);

  p.headers.set ("Content-Range", "bytes */2500");
  assert (!p.range_start ());

  p.headers.set ("Content-Range", "items 1-2/3");
  assert (!p.range_start ());

  http_response m (http_status::found);
  m.headers.set ("Location", "/elsewhere");
  assert (m.is_redirection ());
  assert (*m.location () == "/elsewhere");

  // Codes we don't name still round-trip.
  //
  http_response t (static_cast<http_status> (418));
  assert (t.status_code () == 418);
}

static void
test_status_error ()
{
  http_status_error e (http_status::forbidden, "https://x/y");
  assert (e.status == http_status::forbidden);
  assert (string (e.what ()).find ("403") != string::npos);
  assert (string (e.what ()).find ("https://x/y") != string::npos);
}

int
main ()
{
  test_parse_url ();
  test_resolve_location ();
  test_headers ();
  test_request ();
  test_response ();
  test_status_error ();
}
