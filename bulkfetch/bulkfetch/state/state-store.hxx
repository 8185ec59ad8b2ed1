#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <filesystem>

#include <bulkfetch/state/state-types.hxx>

namespace bulkfetch
{
  namespace fs = std::filesystem;

  // Durable name to progress mapping.
  //
  // The record lives in the output directory and is read once when a run
  // starts and written once when it ends. In between, concurrent transfers
  // merge their own entries; every operation on the mapping is serialized.
  //
  class state_store
  {
  public:
    static constexpr const char* file_name = ".download_state.json";

    explicit
    state_store (const fs::path& output_dir);

    state_store (const state_store&) = delete;
    state_store& operator= (const state_store&) = delete;

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

    // Replace the in-memory mapping with the record on disk.
    //
    // If resume is false, or the record does not exist, the mapping is left
    // empty. A record that cannot be parsed is ignored with a warning (the
    // partial files are what we resume from anyway). A record that exists
    // but cannot be read is a storage failure and is thrown.
    //
    void
    load (bool resume = true);

    // Atomically replace the record with the current mapping.
    //
    void
    save () const;

    std::optional<transfer_progress>
    find (const std::string& name) const;

    // Insert or replace the entry for p.name.
    //
    void
    merge (transfer_progress p);

    // All entries ordered by name.
    //
    std::vector<transfer_progress>
    entries () const;

    std::size_t
    size () const;

  private:
    fs::path path_;

    mutable std::mutex mutex_;
    std::map<std::string, transfer_progress> map_;
  };
}
