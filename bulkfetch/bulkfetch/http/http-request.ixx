namespace bulkfetch
{
  // Note that the Range header is inclusive and open-ended here: we want
  // everything from the offset to the end, whatever the end turns out to be.
  //
  template <typename S>
  inline void basic_http_request<S>::
  set_range (std::uint64_t offset)
  {
    if (offset == 0)
    {
      headers.remove (string_type ("Range"));
      return;
    }

    set_header (string_type ("Range"),
                string_type ("bytes=") +
                std::to_string (offset) +
                string_type ("-"));
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& user_agent)
  {
    if (!has_header (string_type ("Host")))
      set_header (string_type ("Host"),
                  string_type (parse_url (url).authority ()));

    if (!has_header (string_type ("User-Agent")))
      set_header (string_type ("User-Agent"), user_agent);
  }
}
