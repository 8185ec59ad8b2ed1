#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <utility>
#include <optional>

namespace bulkfetch
{
  // A named remote object.
  //
  // The name doubles as the key in the progress store and as the output file
  // name, so it must be a single valid path component.
  //
  struct catalog_entry
  {
    std::string name;
    std::string url;

    catalog_entry () = default;

    catalog_entry (std::string n, std::string u)
      : name (std::move (n)), url (std::move (u)) {}
  };

  inline bool
  operator== (const catalog_entry& x, const catalog_entry& y) noexcept
  {
    return x.name == y.name && x.url == y.url;
  }

  inline bool
  operator!= (const catalog_entry& x, const catalog_entry& y) noexcept
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& os, const catalog_entry& e)
  {
    return os << e.name << " <" << e.url << ">";
  }

  // Deduplicated (by name) and sorted (by name) list of entries.
  //
  using catalog = std::vector<catalog_entry>;

  // Return true if the name is usable as an output file name: non-empty, not
  // "." or "..", and free of path separators and NUL.
  //
  bool
  valid_entry_name (const std::string&);

  // Which part of the catalog to fetch.
  //
  enum class selection_mode
  {
    all,    // Every entry.
    single, // One entry, by name.
    range   // Inclusive index range into the sorted catalog.
  };

  std::string
  to_string (selection_mode);

  // Throw std::invalid_argument if the string is not a known mode.
  //
  selection_mode
  to_selection_mode (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, selection_mode m)
  {
    return os << to_string (m);
  }

  struct catalog_selection
  {
    selection_mode mode {selection_mode::all};

    // For single.
    //
    std::optional<std::string> name;

    // For range (both inclusive).
    //
    std::optional<std::size_t> start;
    std::optional<std::size_t> end;
  };
}
