#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <boost/json.hpp>

namespace bulkfetch
{
  namespace json = boost::json;

  // Last known progress of one catalog entry.
  //
  // Note that the resume offset is not recorded here: the length of the
  // partial file on disk is the only checkpoint. This is what we show the
  // user and what tells us a previous run already verified the output.
  //
  struct transfer_progress
  {
    std::string name;
    std::uint64_t downloaded_bytes {0};

    // Empty until a probe reports a size. Once known it is never cleared.
    //
    std::optional<std::uint64_t> total_bytes;

    // If true, <output>/<name> exists and is downloaded_bytes long.
    //
    bool completed {false};

    transfer_progress () = default;

    explicit
    transfer_progress (std::string n)
      : name (std::move (n)) {}
  };

  inline bool
  operator== (const transfer_progress& x, const transfer_progress& y) noexcept
  {
    return x.name == y.name &&
           x.downloaded_bytes == y.downloaded_bytes &&
           x.total_bytes == y.total_bytes &&
           x.completed == y.completed;
  }

  inline bool
  operator!= (const transfer_progress& x, const transfer_progress& y) noexcept
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& os, const transfer_progress& p)
  {
    os << p.name << ": " << p.downloaded_bytes << '/';

    if (p.total_bytes)
      os << *p.total_bytes;
    else
      os << '?';

    if (p.completed)
      os << " (completed)";

    return os;
  }

  // JSON representation:
  //
  // {"file_name": "...", "downloaded_bytes": N, "total_bytes": N|null,
  //  "completed": true|false}
  //
  json::object
  to_json (const transfer_progress&);

  // Throw std::invalid_argument if the value does not match the schema.
  //
  transfer_progress
  progress_from_json (const json::value&);
}
