#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <type_traits>
#include <cstddef>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <bulkfetch/http/http-types.hxx>
#include <bulkfetch/http/http-request.hxx>
#include <bulkfetch/http/http-response.hxx>

namespace bulkfetch
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds. While a body is streaming the timer is
    // re-armed on every read, so this bounds a stall rather than the whole
    // transfer.
    //
    std::uint32_t request_timeout = 300000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    bool follow_redirects = true;

    // Whether to verify the peer certificate (and its host name).
    //
    bool verify_ssl = true;

    // CA bundle path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("bulkfetch");

    // HTTP proxy URL (http://host:port). Empty means connect directly.
    //
    string_type proxy;

    // Size of the buffer the response body is read into.
    //
    std::size_t buffer_size = 64 * 1024;
  };

  // HTTP client session context.
  //
  // Holds what all requests share: the I/O context, the TLS context, and the
  // parsed proxy endpoint.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();

      if (!traits_.proxy.empty ())
        proxy_ = parse_url (traits_.proxy);
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

    const std::optional<url_parts>&
    proxy () const noexcept
    {
      return proxy_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
    std::optional<url_parts> proxy_;
  };

  // Result of a streamed download.
  //
  template <typename S>
  struct basic_http_download
  {
    // Final URL (after redirects) and the status it answered with (200 or
    // 206).
    //
    S url;
    http_status status {http_status::ok};

    // Length of the body as announced by the server. For a ranged request
    // this is the length of the remainder, not of the whole content.
    //
    std::optional<std::uint64_t> content_length;

    // Bytes handed to the sink.
    //
    std::uint64_t bytes {0};
  };

  // HTTP client.
  //
  // Asynchronous (coroutine-based) HTTP/1.1 over Boost.Beast, plain or TLS,
  // directly or through an HTTP proxy.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;
    using download_type = basic_http_download<string_type>;

    // Body chunk consumer. The buffer is only valid until the returned
    // awaitable completes.
    //
    using chunk_sink =
      std::function<asio::awaitable<void> (const char*, std::size_t)>;

    // Called with the response head once the status is known to be 200 or
    // 206 and before any body is read. May throw to abandon the transfer.
    //
    using head_hook = std::function<void (const response_type&)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a HEAD request and return the response head. Redirects are
    // followed; the status is returned as is.
    //
    asio::awaitable<response_type>
    head (const string_type& url);

    // Stream the content at url into sink, starting at offset if it is not
    // zero. Throw http_status_error unless the server answers 200 or 206.
    //
    asio::awaitable<download_type>
    download (const string_type& url,
              chunk_sink sink,
              std::uint64_t offset = 0,
              head_hook hook = nullptr);

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirect_count);

    asio::awaitable<download_type>
    download_impl (string_type url,
                   chunk_sink sink,
                   head_hook hook,
                   std::uint64_t offset,
                   std::uint8_t redirect_count);

    // Open a connection suitable for talking to u (resolving, connecting,
    // tunneling through the proxy and performing the TLS handshake as
    // needed), then run f on the resulting stream.
    //
    template <typename F>
    auto
    connect (const url_parts& u, F f)
      -> std::invoke_result_t<F&, beast::tcp_stream&>;

    // Establish a CONNECT tunnel to u through the proxy we are connected to.
    //
    asio::awaitable<void>
    tunnel (beast::tcp_stream& s, const url_parts& u);

    template <typename H>
    static response_type
    to_response (const H& header);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <bulkfetch/http/http-client.ixx>
#include <bulkfetch/http/http-client.txx>
