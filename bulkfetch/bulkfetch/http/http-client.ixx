namespace bulkfetch
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& url)
  {
    co_return co_await request_impl (request_type (http_method::head, url), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::download_type>
  basic_http_client<T>::
  download (const string_type& url,
            chunk_sink sink,
            std::uint64_t offset,
            head_hook hook)
  {
    co_return co_await download_impl (url,
                                      std::move (sink),
                                      std::move (hook),
                                      offset,
                                      0);
  }

  template <typename T>
  template <typename H>
  inline typename basic_http_client<T>::response_type
  basic_http_client<T>::
  to_response (const H& h)
  {
    // Note: result_int() rather than result() since the latter collapses
    // codes Beast does not know about into status::unknown.
    //
    response_type r (static_cast<http_status> (h.result_int ()));
    r.reason = string_type (h.reason ());

    for (const auto& f: h)
      r.headers.add (string_type (f.name_string ()),
                     string_type (f.value ()));

    return r;
  }
}
