#pragma once

// In-memory stand-in for the HTTP client used by the transfer tests.
//

#include <map>
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <exception>
#include <functional>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <algorithm>

#include <boost/asio.hpp>

#include <bulkfetch/http/http-types.hxx>
#include <bulkfetch/http/http-client.hxx>
#include <bulkfetch/http/http-response.hxx>
#include <bulkfetch/transfer/transfer-task.hxx>

namespace bulkfetch
{
  namespace test
  {
    namespace asio = boost::asio;
    namespace fs   = std::filesystem;

    struct fake_object
    {
      std::string body;

      // Whether HEAD reports a Content-Length (or answers at all).
      //
      bool head_size = true;
      http_status head_status = http_status::ok;

      // Content-Length HEAD reports instead of the body size.
      //
      std::optional<std::uint64_t> head_length;

      // Number of GETs that fail with a connection reset before any data.
      //
      std::size_t failures = 0;

      // If set, the first GET delivers this many bytes and then drops the
      // connection.
      //
      std::optional<std::size_t> cut_after;

      // Whether a ranged GET gets 206 and the tail, or 200 and everything.
      //
      bool honor_range = true;

      // How far before the requested offset a ranged answer starts.
      //
      std::size_t range_skew = 0;
    };

    class fake_client
    {
    public:
      using response_type = http_response;
      using download_type = basic_http_download<std::string>;

      using chunk_sink =
        std::function<asio::awaitable<void> (const char*, std::size_t)>;

      using head_hook = std::function<void (const response_type&)>;

      explicit
      fake_client (asio::io_context& ioc): ioc_ (ioc) {}

      std::map<std::string, fake_object> objects;

      std::size_t chunk_size = 100;

      // Simulated round trip, which is what lets transfers overlap.
      //
      std::chrono::milliseconds latency {0};

      // What we observed.
      //
      std::size_t heads = 0;
      std::size_t gets = 0;
      std::vector<std::uint64_t> offsets; // Of each GET, in order.
      std::size_t in_flight = 0;
      std::size_t max_in_flight = 0;

      asio::awaitable<response_type>
      head (const std::string& url)
      {
        flight f (*this);
        ++heads;
        co_await pause ();

        auto i (objects.find (url));
        if (i == objects.end ())
          co_return response_type (http_status::not_found);

        response_type r (i->second.head_status);
        if (i->second.head_size)
          r.headers.set ("Content-Length",
                         std::to_string (i->second.head_length
                                         ? *i->second.head_length
                                         : i->second.body.size ()));
        co_return r;
      }

      asio::awaitable<download_type>
      download (const std::string& url,
                chunk_sink sink,
                std::uint64_t offset = 0,
                head_hook hook = nullptr)
      {
        flight f (*this);
        ++gets;
        offsets.push_back (offset);
        co_await pause ();

        auto i (objects.find (url));
        if (i == objects.end ())
          throw http_status_error (http_status::not_found, url);

        fake_object& o (i->second);

        if (o.failures != 0)
        {
          --o.failures;
          throw boost::system::system_error (
            asio::error::connection_reset);
        }

        bool ranged (offset != 0 && o.honor_range);

        download_type r;
        r.url = url;
        r.status = ranged ? http_status::partial_content : http_status::ok;

        std::size_t b (ranged ? static_cast<std::size_t> (offset) : 0);

        if (ranged)
          b -= std::min (b, o.range_skew);

        r.content_length = o.body.size () - b;

        if (hook)
        {
          response_type h (r.status);
          h.headers.set ("Content-Length", std::to_string (*r.content_length));

          if (ranged)
            h.headers.set ("Content-Range",
                           "bytes " + std::to_string (b) + '-' +
                           std::to_string (o.body.size () - 1) + '/' +
                           std::to_string (o.body.size ()));
          hook (h);
        }

        std::optional<std::size_t> cut (o.cut_after);
        o.cut_after = std::nullopt;

        for (std::size_t p (b); p < o.body.size (); )
        {
          std::size_t n (std::min (chunk_size, o.body.size () - p));

          if (cut && r.bytes + n > *cut)
            n = *cut - static_cast<std::size_t> (r.bytes);

          if (n != 0)
          {
            co_await sink (o.body.data () + p, n);
            r.bytes += n;
            p += n;
          }

          if (cut && r.bytes == *cut)
            throw boost::system::system_error (asio::error::eof);

          co_await pause ();
        }

        co_return r;
      }

    private:
      struct flight
      {
        explicit
        flight (fake_client& c): c_ (c)
        {
          if (++c_.in_flight > c_.max_in_flight)
            c_.max_in_flight = c_.in_flight;
        }

        ~flight () {--c_.in_flight;}

        fake_client& c_;
      };

      asio::awaitable<void>
      pause ()
      {
        asio::steady_timer t (ioc_, latency);
        co_await t.async_wait (asio::use_awaitable);
      }

      asio::io_context& ioc_;
    };

    using fake_traits = transfer_traits<fake_client>;

    // Drive a coroutine to completion on ioc and return its result.
    //
    template <typename R>
    R
    run (asio::io_context& ioc, asio::awaitable<R> a)
    {
      std::optional<R> r;
      std::exception_ptr x;

      // Keep run() from returning while work is off on another executor.
      //
      auto w (asio::make_work_guard (ioc));

      asio::co_spawn (ioc,
                      std::move (a),
                      [&r, &x, &w] (std::exception_ptr e, R v)
                      {
                        x = e;
                        if (!e)
                          r = std::move (v);
                        w.reset ();
                      });

      ioc.restart ();
      ioc.run ();

      if (x)
        std::rethrow_exception (x);

      return std::move (*r);
    }

    inline fs::path
    scratch (const std::string& n)
    {
      fs::path d (fs::temp_directory_path () / ("bulkfetch-" + n));
      fs::remove_all (d);
      fs::create_directories (d);
      return d;
    }

    inline std::string
    read_file (const fs::path& p)
    {
      std::ifstream ifs (p, std::ios::binary);
      return std::string ((std::istreambuf_iterator<char> (ifs)),
                          std::istreambuf_iterator<char> ());
    }

    inline void
    write_file (const fs::path& p, const std::string& s)
    {
      std::ofstream ofs (p, std::ios::binary | std::ios::trunc);
      ofs << s;
    }

    // Deterministic content of a given size.
    //
    inline std::string
    content (std::size_t n, char seed = 'a')
    {
      std::string s (n, '\0');
      for (std::size_t i (0); i != n; ++i)
        s[i] = static_cast<char> (seed + i % 23);
      return s;
    }
  }
}
