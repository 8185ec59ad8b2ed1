#include <bulkfetch/bulkfetch-transfer.hxx>

#include <stdexcept>
#include <system_error>

using namespace std;

namespace bulkfetch
{
  // The pool only ever waits on the disk so a couple of threads are enough
  // to keep the transfers from blocking each other.
  //
  static const size_t file_threads (2);

  static const fs::path&
  prepare_output (const fs::path& d)
  {
    error_code ec;
    fs::create_directories (d, ec);

    if (ec)
      throw runtime_error ("unable to create output directory " +
                           d.string () + ": " + ec.message ());

    return d;
  }

  transfer_coordinator::
  transfer_coordinator (asio::io_context& ioc,
                        const http_client_traits<>& http,
                        transfer_options o,
                        transfer_observer& observer)
    : files_ (file_threads),
      http_ (make_unique<http_client> (ioc, http)),
      store_ (prepare_output (o.output_dir)),
      resume_ (o.resume),
      scheduler_ (make_unique<scheduler_type> (ioc,
                                               *http_,
                                               files_.get_executor (),
                                               move (o),
                                               observer))
  {
  }

  transfer_coordinator::
  ~transfer_coordinator ()
  {
    files_.join ();
  }

  asio::awaitable<transfer_summary> transfer_coordinator::
  execute (const catalog& c)
  {
    store_.load (resume_);

    transfer_summary r (co_await scheduler_->run (c, store_));

    store_.save ();
    co_return r;
  }

  void transfer_coordinator::
  cancel () noexcept
  {
    scheduler_->cancel ();
  }
}
