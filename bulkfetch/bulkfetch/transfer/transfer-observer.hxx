#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include <bulkfetch/transfer/transfer-types.hxx>

namespace bulkfetch
{
  // Receives progress notifications from running transfers.
  //
  // Notifications for different entries may come from different transfers
  // interleaved, but always on the thread that drives the scheduler.
  //
  class transfer_observer
  {
  public:
    virtual
    ~transfer_observer () = default;

    // Human-readable state change ("probing", "resuming at 1024", etc).
    //
    virtual void
    status (const std::string& name, const std::string& message) = 0;

    // Bytes on disk for this entry so far, and the expected total if known.
    //
    virtual void
    bytes (const std::string& name,
           std::uint64_t downloaded,
           std::optional<std::uint64_t> total) = 0;

    // An attempt failed and another one will follow. By default this is
    // just another state change.
    //
    virtual void
    retry (const std::string& name, const std::string& message)
    {
      status (name, message);
    }

    // The entry reached its final status.
    //
    virtual void
    finished (const transfer_outcome&) {}
  };

  class null_transfer_observer: public transfer_observer
  {
  public:
    void
    status (const std::string&, const std::string&) override {}

    void
    bytes (const std::string&,
           std::uint64_t,
           std::optional<std::uint64_t>) override {}
  };
}
