#include "events/jsonl_writer.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace camlink::events {

bool StartEventLog(const fs::path& output_dir, fs::path& log_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }

  log_path = output_dir / "events.jsonl";
  std::ofstream out_file(log_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to create event log '" + log_path.string() + "'";
    return false;
  }
  return true;
}

bool AppendEventJsonl(const Event& event, const fs::path& log_path, std::string& error) {
  std::ofstream out_file(log_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + log_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while writing event log '" + log_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace camlink::events
