#include <limits>
#include <vector>
#include <chrono>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace bulkfetch
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return http::verb::get;
      case http_method::head:    return http::verb::head;
      case http_method::connect: return http::verb::connect;
    }
    return http::verb::get;
  }

  template <typename T>
  template <typename F>
  auto basic_http_client<T>::
  connect (const url_parts& u, F f)
    -> std::invoke_result_t<F&, beast::tcp_stream&>
  {
    using namespace std::chrono;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());
    const auto& px (session_->proxy ());

    // Through a proxy we dial the proxy itself. For plain HTTP it forwards
    // the absolute-form request, for HTTPS we ask it for a tunnel first.
    //
    const url_parts& d (px ? *px : u);

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (d.host,
                                             d.port,
                                             asio::use_awaitable));

    if (!u.secure ())
    {
      beast::tcp_stream s (ctx);
      s.expires_after (milliseconds (tr.connect_timeout));
      co_await s.async_connect (addrs, asio::use_awaitable);

      auto r (co_await f (s));

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }

    using stream_type = beast::ssl_stream<beast::tcp_stream>;
    stream_type s (ctx, session_->ssl_context ());

    // We must set the SNI hostname, otherwise many servers (CDNs especially)
    // reject the handshake or present the wrong certificate.
    //
    // Note that Beast doesn't wrap this so we drop down to the OpenSSL C API
    // through the native handle.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());
      throw beast::system_error (ec, "failed to set SNI hostname");
    }

    if (tr.verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (u.host));

    auto& layer (beast::get_lowest_layer (s));
    layer.expires_after (milliseconds (tr.connect_timeout));
    co_await layer.async_connect (addrs, asio::use_awaitable);

    if (px)
      co_await tunnel (layer, u);

    co_await s.async_handshake (ssl::stream_base::client,
                                asio::use_awaitable);

    auto r (co_await f (s));

    // We don't wait for async_shutdown: plenty of servers never answer the
    // close_notify and we would just sit there until the timeout.
    //
    beast::error_code ec;
    layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
    co_return r;
  }

  template <typename T>
  asio::awaitable<void> basic_http_client<T>::
  tunnel (beast::tcp_stream& s, const url_parts& u)
  {
    using namespace std::chrono;

    const auto& tr (session_->traits ());
    std::string a (u.host + ':' + u.port);

    http::request<http::empty_body> req (http::verb::connect, a, 11);
    req.set (http::field::host, a);
    req.set (http::field::user_agent, tr.user_agent);

    s.expires_after (milliseconds (tr.request_timeout));
    co_await http::async_write (s, req, asio::use_awaitable);

    // A successful CONNECT response has no body, whatever its headers claim.
    //
    beast::flat_buffer b;
    http::response_parser<http::empty_body> p;
    p.skip (true);
    co_await http::async_read (s, b, p, asio::use_awaitable);

    if (p.get ().result_int () != 200)
      throw http_protocol_error (
        "proxy refused tunnel to " + a + ": " +
        std::to_string (p.get ().result_int ()) + ' ' +
        std::string (p.get ().reason ()));
  }

  // Execute a request with automatic redirect handling.
  //
  // Only the response head is read: HEAD has no body and we never buffer GET
  // bodies in memory (see download_impl() for that).
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    using namespace std::chrono;

    const auto& tr (session_->traits ());

    if (redirect_count >= tr.max_redirects)
      throw http_protocol_error ("maximum redirects exceeded [url: " +
                                 req.url + "]");

    req.normalize (tr.user_agent);

    url_parts u (parse_url (req.url));
    bool absolute (session_->proxy () && !u.secure ());

    response_type r (
      co_await connect (u, [&] (auto& s) -> asio::awaitable<response_type>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br (to_beast_verb (req.method),
                                          req.target (absolute),
                                          11);
      for (const auto& h: req.headers)
        br.set (h.name, h.value);

      layer.expires_after (milliseconds (tr.request_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      // A HEAD response announces a body that never comes. Tell the parser
      // so it doesn't wait for it.
      //
      beast::flat_buffer b;
      http::response_parser<http::empty_body> p;
      p.skip (req.method == http_method::head);
      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      co_return to_response (p.get ());
    }));

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        request_type next (req.method, resolve_location (req.url, *loc));
        co_return co_await request_impl (std::move (next), redirect_count + 1);
      }
    }

    co_return r;
  }

  // Internal download implementation.
  //
  // Unlike request_impl() we need the body here, which we stream chunk by
  // chunk into the sink. The caller owns what happens to the bytes (in our
  // case, appending them to the partial file).
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::download_type>
  basic_http_client<T>::
  download_impl (string_type url,
                 chunk_sink sink,
                 head_hook hook,
                 std::uint64_t offset,
                 std::uint8_t redirect_count)
  {
    using namespace std::chrono;
    using parser_type = http::response_parser<http::buffer_body>;

    const auto& tr (session_->traits ());

    if (redirect_count >= tr.max_redirects)
      throw http_protocol_error ("maximum redirects exceeded [url: " +
                                 url + "]");

    request_type req (http_method::get, url);
    req.set_range (offset);
    req.normalize (tr.user_agent);

    url_parts u (parse_url (url));
    bool absolute (session_->proxy () && !u.secure ());

    download_type r;
    r.url = url;

    std::optional<string_type> redirect;

    auto transfer = [&] (auto& s) -> asio::awaitable<bool>
    {
      auto& layer (beast::get_lowest_layer (s));

      http::request<http::empty_body> br (http::verb::get,
                                          req.target (absolute),
                                          11);
      for (const auto& h: req.headers)
        br.set (h.name, h.value);

      layer.expires_after (milliseconds (tr.request_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      parser_type p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      unsigned st (p.get ().result_int ());

      // If the server asks us to go elsewhere, bail out of this connection
      // and let the caller start over with the new location.
      //
      if (tr.follow_redirects && st >= 300 && st < 400)
      {
        auto loc (p.get ()[http::field::location]);
        if (!loc.empty ())
        {
          redirect = resolve_location (url, string_type (loc));
          co_return false;
        }
      }

      r.status = static_cast<http_status> (st);

      // Note that 206 Partial Content is only expected if we asked for a
      // range, but a 206 for the whole content is still the whole content.
      //
      if (st != 200 && st != 206)
        throw http_status_error (r.status, url);

      if (p.content_length ())
        r.content_length = *p.content_length ();

      if (hook)
        hook (to_response (p.get ()));

      std::vector<char> buf (tr.buffer_size);

      while (!p.is_done ())
      {
        // Re-arm the timeout while data keeps flowing so that a large file
        // doesn't trip it half way through.
        //
        layer.expires_after (milliseconds (tr.request_timeout));

        p.get ().body ().data = buf.data ();
        p.get ().body ().size = buf.size ();

        // The parser stops with need_buffer once our buffer is full, which
        // is the normal way of reading a buffer_body in pieces.
        //
        beast::error_code ec;
        co_await http::async_read (s, b, p,
                                   asio::redirect_error (asio::use_awaitable,
                                                         ec));
        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        // What we got is what the parser wrote into the buffer. The count the
        // read returns includes the header and any chunked framing.
        //
        std::size_t n (buf.size () - p.get ().body ().size);

        if (n != 0)
        {
          co_await sink (buf.data (), n);
          r.bytes += n;
        }
      }

      co_return true;
    };

    if (!co_await connect (u, transfer))
      co_return co_await download_impl (std::move (*redirect),
                                        std::move (sink),
                                        std::move (hook),
                                        offset,
                                        redirect_count + 1);

    co_return r;
  }
}
