#include <bulkfetch/transfer/transfer-types.hxx>

#include <ios>
#include <filesystem>
#include <system_error>

#include <boost/system/system_error.hpp>

#include <bulkfetch/http/http-types.hxx>

using namespace std;

namespace bulkfetch
{
  string
  to_string (transfer_error_kind k)
  {
    switch (k)
    {
    case transfer_error_kind::transport: return "transport";
    case transfer_error_kind::protocol:  return "protocol";
    case transfer_error_kind::integrity: return "integrity";
    case transfer_error_kind::storage:   return "storage";
    case transfer_error_kind::cancelled: return "cancelled";
    }

    return "unknown";
  }

  string
  to_string (transfer_status s)
  {
    switch (s)
    {
    case transfer_status::pending:   return "pending";
    case transfer_status::done:      return "done";
    case transfer_status::skipped:   return "skipped";
    case transfer_status::mismatch:  return "mismatch";
    case transfer_status::failed:    return "failed";
    case transfer_status::cancelled: return "cancelled";
    }

    return "unknown";
  }

  transfer_error_kind
  classify_error (const exception_ptr& e)
  {
    if (!e)
      return transfer_error_kind::transport;

    // Order matters: filesystem_error is a std::system_error and the HTTP
    // errors are runtime_errors.
    //
    try
    {
      rethrow_exception (e);
    }
    catch (const transfer_error& x)
    {
      return x.kind ();
    }
    catch (const http_protocol_error&)
    {
      return transfer_error_kind::protocol;
    }
    catch (const filesystem::filesystem_error&)
    {
      return transfer_error_kind::storage;
    }
    catch (const ios_base::failure&)
    {
      return transfer_error_kind::storage;
    }
    catch (const boost::system::system_error&)
    {
      return transfer_error_kind::transport;
    }
    catch (const invalid_argument&)
    {
      // Unparsable URL.
      //
      return transfer_error_kind::protocol;
    }
    catch (const exception&)
    {
      return transfer_error_kind::transport;
    }
  }

  string
  error_message (const exception_ptr& e)
  {
    if (!e)
      return string ();

    try
    {
      rethrow_exception (e);
    }
    catch (const exception& x)
    {
      return x.what ();
    }
  }
}
