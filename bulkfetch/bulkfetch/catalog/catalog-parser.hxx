#pragma once

#include <istream>
#include <filesystem>

#include <bulkfetch/catalog/catalog-types.hxx>

namespace bulkfetch
{
  namespace fs = std::filesystem;

  // Parse a tab-separated catalog (file_name<TAB>url per line).
  //
  // A first line starting with "file_name" is a header and is skipped. Blank
  // lines, lines without a tab, and lines whose name is not a valid file
  // name are ignored. The first occurrence of a name wins. The result is
  // sorted by name.
  //
  catalog
  parse_catalog (std::istream&);

  // Load and parse the catalog file. Throw std::invalid_argument if it does
  // not exist or holds no entries (both configuration problems) and
  // std::runtime_error if it cannot be read.
  //
  catalog
  load_catalog (const fs::path&);

  // Apply the selection to the catalog, validating it first. Throw
  // std::invalid_argument if a required parameter is missing, the named
  // entry does not exist, or the range is out of bounds or inverted.
  //
  catalog
  select_entries (const catalog&, const catalog_selection&);
}
