#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using camlink::events::Event;
  using camlink::events::EventType;
  using camlink::tests::common::AssertContains;
  using camlink::tests::common::Fail;

  const fs::path out_dir = camlink::tests::common::CreateUniqueTempDir("camlink-events-jsonl") /
                           "nested" / "run";

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  first.type = EventType::kCommandSubmitted;
  first.payload = {
      {"device_id", "2"},
      {"command", "trigger_start"},
  };

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  second.type = EventType::kCommandTimedOut;
  second.payload = {
      {"device_id", "5"},
      {"error_code", "TIMED_OUT"},
  };

  fs::path log_path;
  std::string error;
  if (!camlink::events::StartEventLog(out_dir, log_path, error)) {
    Fail("failed to start event log: " + error);
  }
  if (log_path != out_dir / "events.jsonl") {
    Fail("event log should live at <out>/events.jsonl");
  }
  if (!camlink::events::AppendEventJsonl(first, log_path, error) ||
      !camlink::events::AppendEventJsonl(second, log_path, error)) {
    Fail("failed to append event: " + error);
  }

  const auto lines = camlink::tests::common::ReadJsonlRecords(log_path);
  if (lines.size() != 2U) {
    Fail("expected exactly two lines");
  }
  AssertContains(lines[0], R"("type":"COMMAND_SUBMITTED")");
  AssertContains(lines[0], R"("ts_utc":"1970-01-01T00:00:01.000Z")");
  AssertContains(lines[1], R"("type":"COMMAND_TIMED_OUT")");
  AssertContains(lines[1], R"("error_code":"TIMED_OUT")");

  // Starting again discards the previous run.
  if (!camlink::events::StartEventLog(out_dir, log_path, error)) {
    Fail("failed to restart event log: " + error);
  }
  if (!camlink::tests::common::ReadJsonlRecords(log_path).empty()) {
    Fail("restarted event log should be empty");
  }

  if (camlink::events::StartEventLog(fs::path(), log_path, error)) {
    Fail("empty output directory must be refused");
  }
  AssertContains(error, "output directory cannot be empty");

  camlink::tests::common::RemovePathBestEffort(out_dir.parent_path().parent_path());
  return 0;
}
