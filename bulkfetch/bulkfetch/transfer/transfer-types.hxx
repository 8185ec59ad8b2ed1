#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <exception>

#include <bulkfetch/catalog/catalog-types.hxx>
#include <bulkfetch/state/state-types.hxx>

namespace bulkfetch
{
  // Why a transfer attempt failed.
  //
  enum class transfer_error_kind
  {
    transport, // Network level: resolve, connect, TLS, reset, timeout.
    protocol,  // The server answered with something we cannot use.
    integrity, // The final size does not match what we expected.
    storage,   // Local file system.
    cancelled  // Shutdown was requested.
  };

  std::string
  to_string (transfer_error_kind);

  inline std::ostream&
  operator<< (std::ostream& os, transfer_error_kind k)
  {
    return os << to_string (k);
  }

  class transfer_error: public std::runtime_error
  {
  public:
    transfer_error (transfer_error_kind k, const std::string& what)
      : std::runtime_error (what), kind_ (k) {}

    transfer_error_kind
    kind () const noexcept
    {
      return kind_;
    }

  private:
    transfer_error_kind kind_;
  };

  // Map whatever an attempt threw to its failure kind. Errors we don't know
  // about are assumed to be transport-level (and therefore worth retrying).
  //
  transfer_error_kind
  classify_error (const std::exception_ptr&);

  std::string
  error_message (const std::exception_ptr&);

  // Final status of one catalog entry.
  //
  enum class transfer_status
  {
    pending,
    done,      // Downloaded (or resumed) and verified.
    skipped,   // Already present and valid.
    mismatch,  // Integrity failure on the last attempt.
    failed,    // Any other failure on the last attempt.
    cancelled
  };

  std::string
  to_string (transfer_status);

  inline std::ostream&
  operator<< (std::ostream& os, transfer_status s)
  {
    return os << to_string (s);
  }

  struct transfer_outcome
  {
    catalog_entry entry;
    transfer_status status {transfer_status::pending};
    transfer_progress progress;

    // Number of attempts made (0 if the entry never got a slot).
    //
    std::size_t attempts {0};

    std::optional<std::string> error;

    bool
    succeeded () const noexcept
    {
      return status == transfer_status::done ||
             status == transfer_status::skipped;
    }
  };

  // Result of a batch. Outcomes are in catalog order.
  //
  struct transfer_summary
  {
    std::size_t succeeded {0};
    std::size_t failed {0};
    std::size_t cancelled {0};

    std::vector<transfer_outcome> outcomes;
  };
}
