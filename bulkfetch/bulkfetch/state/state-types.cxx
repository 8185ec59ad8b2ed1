#include <bulkfetch/state/state-types.hxx>

#include <stdexcept>

using namespace std;

namespace bulkfetch
{
  json::object
  to_json (const transfer_progress& p)
  {
    json::object o;
    o["file_name"] = p.name;
    o["downloaded_bytes"] = p.downloaded_bytes;

    if (p.total_bytes)
      o["total_bytes"] = *p.total_bytes;
    else
      o["total_bytes"] = nullptr;

    o["completed"] = p.completed;
    return o;
  }

  transfer_progress
  progress_from_json (const json::value& jv)
  {
    if (!jv.is_object ())
      throw invalid_argument ("progress entry must be an object");

    const json::object& o (jv.as_object ());

    try
    {
      transfer_progress p (json::value_to<string> (o.at ("file_name")));

      // Note that the parser produces int64 for anything that fits, so we go
      // through value_to which accepts both signed and unsigned (and rejects
      // negative) representations.
      //
      p.downloaded_bytes =
        json::value_to<uint64_t> (o.at ("downloaded_bytes"));

      // A missing total is the same as null: older records may not have it.
      //
      if (const json::value* t = o.if_contains ("total_bytes"))
      {
        if (!t->is_null ())
          p.total_bytes = json::value_to<uint64_t> (*t);
      }

      p.completed = o.at ("completed").as_bool ();

      if (p.name.empty ())
        throw invalid_argument ("empty file_name");

      return p;
    }
    catch (const invalid_argument&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw invalid_argument (string ("invalid progress entry: ") + e.what ());
    }
  }
}
