#include <ios>
#include <memory>
#include <fstream>
#include <exception>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace bulkfetch
{
  // Size of the regular file at p or nullopt if there is nothing there.
  //
  inline std::optional<std::uint64_t>
  file_size_if_exists (const fs::path& p)
  {
    std::error_code ec;
    fs::file_status s (fs::status (p, ec));

    if (s.type () == fs::file_type::not_found)
      return std::nullopt;

    if (ec)
      throw fs::filesystem_error ("unable to stat", p, ec);

    return static_cast<std::uint64_t> (fs::file_size (p));
  }

  template <typename T>
  template <typename F>
  auto basic_transfer_task<T>::
  blocking (F f) -> asio::awaitable<std::invoke_result_t<F&>>
  {
    using result_type = std::invoke_result_t<F&>;

    co_return co_await asio::co_spawn (
      files_,
      [f = std::move (f)] () mutable -> asio::awaitable<result_type>
      {
        co_return f ();
      },
      asio::use_awaitable);
  }

  template <typename T>
  void basic_transfer_task<T>::
  check_cancel () const
  {
    if (cancel_.load ())
      throw transfer_error (transfer_error_kind::cancelled, "cancelled");
  }

  template <typename T>
  asio::awaitable<transfer_status> basic_transfer_task<T>::
  run (const catalog_entry& e, transfer_progress& p)
  {
    fs::path out (output_path (e));
    fs::path part (partial_path (e));

    check_cancel ();

    std::optional<std::uint64_t> expected (co_await probe (e));

    // Whatever an earlier run recorded, the total is what the server says
    // now. If it won't say, we don't know.
    //
    p.total_bytes = expected;

    // See if a previous run already got us there. With a known size the
    // existing file must match it exactly; otherwise anything that isn't
    // empty is taken at its word.
    //
    if (std::optional<std::uint64_t> n =
          co_await blocking ([out] {return file_size_if_exists (out);}))
    {
      if (expected ? *n == *expected : *n != 0)
      {
        p.downloaded_bytes = *n;
        p.completed = true;

        observer_.status (e.name, "already downloaded, skipping");
        co_return transfer_status::skipped;
      }

      observer_.status (e.name,
                        "existing file has " + std::to_string (*n) +
                        " bytes, expected " +
                        (expected ? std::to_string (*expected) : "more") +
                        "; downloading again");

      co_await blocking ([out] {return fs::remove (out);});
    }

    p.completed = false;

    // Decide where to start. The length of the partial file is the resume
    // offset; without resume we throw it away.
    //
    std::uint64_t off (0);

    if (resume_)
    {
      if (std::optional<std::uint64_t> n =
            co_await blocking ([part] {return file_size_if_exists (part);}))
        off = *n;
    }
    else
      co_await blocking ([part] {return fs::remove (part);});

    // We never truncate: a partial file longer than the content is not
    // something we can resume from.
    //
    if (expected && off > *expected)
    {
      p.downloaded_bytes = 0;

      throw transfer_error (
        transfer_error_kind::integrity,
        "partial file " + part.string () + " has " + std::to_string (off) +
        " bytes, more than the expected " + std::to_string (*expected));
    }

    p.downloaded_bytes = off;
    observer_.bytes (e.name, off, expected);

    // If the partial file is already complete there is nothing to fetch.
    //
    if (!expected || off < *expected)
      co_await fetch (e, part, off, expected, p);

    co_return co_await finalize (e, part, out, expected, p);
  }

  template <typename T>
  asio::awaitable<std::optional<std::uint64_t>> basic_transfer_task<T>::
  probe (const catalog_entry& e)
  {
    observer_.status (e.name, "probing size");

    response_type r (co_await client_.head (e.url));

    // Some servers (and presigned URLs) refuse HEAD but serve GET just fine,
    // so a refusal only means we don't know the size.
    //
    if (!r.is_success ())
    {
      observer_.status (e.name,
                        "size probe answered " +
                        std::to_string (r.status_code ()) +
                        ", size unknown");
      co_return std::nullopt;
    }

    std::optional<std::uint64_t> n (r.content_length ());

    // A zero length is what some servers say when they mean they don't
    // know. Nothing we fetch could ever match it.
    //
    if (n && *n == 0)
    {
      observer_.status (e.name, "size probe reported 0 bytes, size unknown");
      co_return std::nullopt;
    }

    co_return n;
  }

  template <typename T>
  asio::awaitable<void> basic_transfer_task<T>::
  fetch (const catalog_entry& e,
         const fs::path& part,
         std::uint64_t off,
         std::optional<std::uint64_t> expected,
         transfer_progress& p)
  {
    using namespace std;

    observer_.status (e.name,
                      off != 0
                      ? "resuming at " + std::to_string (off)
                      : string ("downloading"));

    // The stream is shared with the file executor so keep it alive for as
    // long as any work on it might be queued.
    //
    auto os (make_shared<ofstream> ());

    co_await blocking ([os, part]
    {
      os->open (part, ios::binary | ios::app);

      if (!*os)
        throw transfer_error (transfer_error_kind::storage,
                              "unable to open " + part.string () +
                              " for writing");
      return true;
    });

    uint64_t n (0);      // Appended in this attempt.
    bool discard (false); // Partial file is of no use any more.

    auto sink = [&, os] (const char* d, size_t s) -> asio::awaitable<void>
    {
      check_cancel ();

      // More than we were told to expect. Whatever the server is sending,
      // it doesn't belong at the end of our partial file.
      //
      if (expected && off + n + s > *expected)
      {
        discard = true;
        throw transfer_error (
          transfer_error_kind::integrity,
          "server sent more than the expected " +
          std::to_string (*expected) + " bytes");
      }

      co_await blocking ([os, d, s]
      {
        os->write (d, static_cast<streamsize> (s));
        os->flush ();

        if (!*os)
          throw transfer_error (transfer_error_kind::storage,
                                "unable to write partial file");
        return true;
      });

      n += s;
      p.downloaded_bytes = off + n;
      observer_.bytes (e.name, p.downloaded_bytes, expected);
    };

    // A plain 200 in answer to a range request is the whole content again.
    // Appending it would corrupt the file so start over next time.
    //
    // Likewise a 206 that starts anywhere but where we asked would splice
    // the wrong bytes onto the partial file.
    //
    auto hook = [&] (const response_type& r)
    {
      if (off == 0)
        return;

      if (r.status == http_status::ok)
      {
        discard = true;
        throw transfer_error (transfer_error_kind::protocol,
                              "server ignored the range request");
      }

      if (std::optional<std::uint64_t> b = r.range_start ())
      {
        if (*b != off)
        {
          discard = true;
          throw transfer_error (
            transfer_error_kind::protocol,
            "server sent a range starting at " + std::to_string (*b) +
            " instead of " + std::to_string (off));
        }
      }
    };

    exception_ptr x;
    try
    {
      co_await client_.download (e.url, sink, off, hook);
    }
    catch (const exception&)
    {
      x = current_exception ();
    }

    bool closed (co_await blocking ([os]
    {
      os->close ();
      return !os->fail ();
    }));

    if (x)
    {
      if (discard)
      {
        co_await blocking ([part] {return fs::remove (part);});
        p.downloaded_bytes = 0;
      }

      rethrow_exception (x);
    }

    if (!closed)
      throw transfer_error (transfer_error_kind::storage,
                            "unable to close " + part.string ());
  }

  template <typename T>
  asio::awaitable<transfer_status> basic_transfer_task<T>::
  finalize (const catalog_entry& e,
            const fs::path& part,
            const fs::path& out,
            std::optional<std::uint64_t> expected,
            transfer_progress& p)
  {
    check_cancel ();

    std::uint64_t n (co_await blocking ([part, out]
    {
      fs::rename (part, out);
      return static_cast<std::uint64_t> (fs::file_size (out));
    }));

    bool valid (expected
                ? n == *expected
                : n > traits_type::min_unknown_size);

    if (!valid)
    {
      // Don't leave a file behind that a later run would mistake for a
      // complete one.
      //
      co_await blocking ([out] {return fs::remove (out);});

      p.downloaded_bytes = 0;
      p.completed = false;

      throw transfer_error (
        transfer_error_kind::integrity,
        expected
        ? "size mismatch: expected " + std::to_string (*expected) +
          " bytes, got " + std::to_string (n)
        : "suspiciously small file of unknown size: " +
          std::to_string (n) + " bytes");
    }

    p.downloaded_bytes = n;
    p.completed = true;

    observer_.status (e.name, "done");
    co_return transfer_status::done;
  }
}
