#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "link/camera_status.hpp"
#include "link/packet_codec.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

using camlink::tests::common::AssertContains;
using camlink::tests::common::Fail;

struct CliRun {
  int exit_code = 0;
  std::string out;
  std::string err;
};

CliRun Run(const std::vector<std::string>& args) {
  std::vector<std::string> argv_storage = {"camlink"};
  argv_storage.insert(argv_storage.end(), args.begin(), args.end());

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  CliRun run;
  run.exit_code = camlink::tests::common::DispatchArgs(argv_storage);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  run.out = captured_out.str();
  run.err = captured_err.str();
  return run;
}

void ExpectExit(const CliRun& run, int expected, std::string_view what) {
  if (run.exit_code != expected) {
    Fail(std::string(what) + ": expected exit " + std::to_string(expected) + ", got " +
         std::to_string(run.exit_code) + "\nstdout:\n" + run.out + "stderr:\n" + run.err);
  }
}

std::string ToHex(const std::vector<std::uint8_t>& bytes) {
  std::string hex;
  char buffer[3];
  for (const std::uint8_t byte : bytes) {
    std::snprintf(buffer, sizeof(buffer), "%02x", byte);
    hex += buffer;
  }
  return hex;
}

std::string EncodeOrFail(const camlink::link::Frame& frame) {
  const camlink::link::PacketCodec codec;
  std::vector<std::uint8_t> bytes;
  camlink::core::errors::LinkError error;
  if (!codec.Encode(frame, bytes, error)) {
    Fail("failed to encode test frame");
  }
  return ToHex(bytes);
}

constexpr std::string_view kPlan = R"({
  "name": "cli_trigger",
  "duration_ms": 3000,
  "remote": {"role": "remote", "local_id": 1, "devices": [2]},
  "controllers": [
    {"node": {"role": "controller", "local_id": 200, "remote_id": 1, "devices": [2]}}
  ],
  "script": [{"at_ms": 100, "action": "submit", "device_id": 2, "command": "trigger_start"}],
  "expect": [{"device_id": 2, "last_outcome": "acked", "status_label": "REC"}]
})";

constexpr std::string_view kFailingPlan = R"({
  "duration_ms": 3000,
  "remote": {"role": "remote", "local_id": 1, "devices": [2]},
  "controllers": [
    {"node": {"role": "controller", "local_id": 200, "remote_id": 1, "devices": [2]}}
  ],
  "expect": [{"device_id": 2, "last_outcome": "acked"}]
})";

} // namespace

int main() {
  const fs::path root = camlink::tests::common::CreateUniqueTempDir("camlink-cli");

  {
    const auto run = Run({"version"});
    ExpectExit(run, 0, "version");
    AssertContains(run.out, "camlink ");
    AssertContains(run.out, "(protocol v1)");
  }
  ExpectExit(Run({"version", "extra"}), 2, "version with arguments");
  {
    const auto run = Run({"--help"});
    ExpectExit(run, 0, "--help");
    AssertContains(run.out, "usage:");
  }
  {
    const auto run = Run({"launch"});
    ExpectExit(run, 2, "unknown subcommand");
    AssertContains(run.err, "unknown subcommand: launch");
  }
  ExpectExit(Run({}), 2, "no subcommand");

  // validate
  {
    const fs::path good = root / "remote.json";
    camlink::tests::common::WriteFixtureFile(good, R"({"role": "remote", "local_id": 1, "devices": [2, 3]})");
    const auto run = Run({"validate", good.string()});
    ExpectExit(run, 0, "validate good config");
    AssertContains(run.out, "valid: ");
    AssertContains(run.out, "role=remote");
    AssertContains(run.out, "devices=2");

    const fs::path bad = root / "bad.json";
    camlink::tests::common::WriteFixtureFile(bad, R"({"role": "remote", "local_id": 1, "devices": [2, 255],
                      "retry": {"backoff": "linear"}})");
    const auto invalid = Run({"validate", bad.string()});
    ExpectExit(invalid, 10, "validate bad config");
    AssertContains(invalid.err, "invalid config:");
    AssertContains(invalid.err, "devices[1]: ");
    AssertContains(invalid.err, "retry.backoff: ");

    ExpectExit(Run({"validate", (root / "missing.json").string()}), 1, "validate missing file");
    ExpectExit(Run({"validate"}), 2, "validate without path");
  }

  // decode
  {
    camlink::link::Frame trigger;
    trigger.destination = camlink::link::kBroadcastId;
    trigger.source = 1;
    trigger.source_role = camlink::link::SourceRole::kRemote;
    trigger.command = camlink::link::CommandKind::kTriggerStart;
    trigger.sequence = 513;
    const auto run = Run({"decode", EncodeOrFail(trigger)});
    ExpectExit(run, 0, "decode trigger");
    AssertContains(run.out, "destination=255 (broadcast)");
    AssertContains(run.out, "role=remote");
    AssertContains(run.out, "command=trigger_start");
    AssertContains(run.out, "sequence=513");
    AssertContains(run.out, "payload_bytes=0");

    camlink::link::Frame ack;
    ack.destination = 1;
    ack.source = 2;
    ack.source_role = camlink::link::SourceRole::kController;
    ack.command = camlink::link::CommandKind::kAck;
    ack.sequence = 7;
    ack.payload = camlink::link::EncodeAckPayload(
        {.acked_command = camlink::link::CommandKind::kWakeUp,
         .result = camlink::link::AckResult::kCameraFailed});
    const auto acked = Run({"decode", EncodeOrFail(ack)});
    ExpectExit(acked, 0, "decode ack");
    AssertContains(acked.out, "role=controller");
    AssertContains(acked.out, "acked_command=wake_up");
    AssertContains(acked.out, "result=camera_failed");

    camlink::link::Frame heartbeat = ack;
    heartbeat.command = camlink::link::CommandKind::kHeartbeat;
    camlink::link::CameraStatus status;
    status.recording_state = camlink::link::RecordingState::kRecording;
    status.battery_percent = 64;
    status.camera_connected = true;
    heartbeat.payload = camlink::link::EncodeCameraStatus(status);
    const auto beat = Run({"decode", EncodeOrFail(heartbeat)});
    ExpectExit(beat, 0, "decode heartbeat");
    AssertContains(beat.out, "battery_percent=64");
    AssertContains(beat.out, "camera_connected=true");

    const auto corrupt = Run({"decode", "ff", "01", "10", "01", "00", "00", "00", "00"});
    ExpectExit(corrupt, 1, "decode corrupt frame");
    AssertContains(corrupt.err, "MALFORMED_FRAME");

    const auto odd = Run({"decode", "0xabc"});
    ExpectExit(odd, 2, "decode odd hex");
    ExpectExit(Run({"decode", "zz"}), 2, "decode non-hex");
    ExpectExit(Run({"decode"}), 2, "decode without bytes");
  }

  // simulate
  {
    const fs::path plan = root / "plan.json";
    camlink::tests::common::WriteFixtureFile(plan, kPlan);
    const fs::path out_dir = root / "out";
    const auto run =
        Run({"simulate", plan.string(), "--out", out_dir.string(), "--log-level", "error"});
    ExpectExit(run, 0, "simulate passing plan");
    AssertContains(run.out, "connectivity");
    AssertContains(run.out, "radio: transmissions=");
    AssertContains(run.out, "events: ");
    AssertContains(run.out, "expectations met: 1");
    if (!fs::exists(out_dir / "events.jsonl")) {
      Fail("simulate should write events.jsonl");
    }

    const fs::path failing = root / "failing.json";
    camlink::tests::common::WriteFixtureFile(failing, kFailingPlan);
    const auto failed =
        Run({"simulate", failing.string(), "--out", out_dir.string(), "--log-level", "error"});
    ExpectExit(failed, 30, "simulate failing plan");
    AssertContains(failed.out, "expectations failed:");
    AssertContains(failed.out, "device 2: expected last_outcome=acked, got none");

    const fs::path broken = root / "broken.json";
    camlink::tests::common::WriteFixtureFile(broken, R"({"duration_ms": 1000, "controllers": []})");
    const auto invalid = Run({"simulate", broken.string(), "--out", out_dir.string()});
    ExpectExit(invalid, 10, "simulate invalid plan");
    AssertContains(invalid.err, "invalid simulation plan:");
    AssertContains(invalid.err, "remote: ");

    ExpectExit(Run({"simulate", plan.string(), "--log-level", "loud"}), 2, "bad log level");
    ExpectExit(Run({"simulate", plan.string(), "--out"}), 2, "missing --out value");
    ExpectExit(Run({"simulate"}), 2, "simulate without plan");
  }

  camlink::tests::common::RemovePathBestEffort(root);
  return 0;
}
