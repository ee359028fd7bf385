#include "camlink/cli/router.hpp"

#include "config/config_loader.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "link/camera_status.hpp"
#include "link/packet_codec.hpp"
#include "sim/simulation_plan.hpp"
#include "sim/simulation_runner.hpp"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace camlink::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitExpectationsFailed =
    core::errors::ToInt(core::errors::ExitCode::kExpectationsFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camlink simulate <plan.json> [--out <dir>] [--log-level <debug|info|warn|error>]\n"
      << "  camlink validate <config.json>\n"
      << "  camlink decode <hex bytes>\n"
      << "  camlink version\n";
}

void PrintIssues(std::ostream& out, const config::ValidationReport& report) {
  for (const auto& issue : report.issues) {
    out << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Existence and file-type checks, kept apart from field-level issues.
bool ValidateInputPath(const std::string& path_text, std::string_view what, std::string& error) {
  if (path_text.empty()) {
    error = std::string(what) + " path cannot be empty";
    return false;
  }

  const fs::path path(path_text);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = std::string(what) + " not found: " + path_text;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = std::string(what) + " must be a regular file: " + path_text;
    return false;
  }
  if (path.extension() != ".json") {
    error = std::string(what) + " must use .json extension: " + path_text;
    return false;
  }
  return true;
}

int HexNibble(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

// Accepts "a1b2", "a1 b2", "a1:b2" and an optional 0x prefix.
bool ParseHexBytes(std::string_view text, std::vector<std::uint8_t>& bytes, std::string& error) {
  if (text.size() >= 2U && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }

  bytes.clear();
  int high = -1;
  for (const char c : text) {
    if (c == ' ' || c == ':' || c == '-') {
      continue;
    }
    const int nibble = HexNibble(c);
    if (nibble < 0) {
      error = std::string("invalid hex character '") + c + "'";
      return false;
    }
    if (high < 0) {
      high = nibble;
    } else {
      bytes.push_back(static_cast<std::uint8_t>((high << 4) | nibble));
      high = -1;
    }
  }
  if (high >= 0) {
    error = "odd number of hex digits";
    return false;
  }
  if (bytes.empty()) {
    error = "no bytes to decode";
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "camlink " << kVersion << " (protocol v"
            << static_cast<int>(link::PacketCodec::kProtocolVersion) << ")\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  std::string error;
  const std::string config_path(args.front());
  if (!ValidateInputPath(config_path, "config file", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::NodeConfig node_config;
  config::ValidationReport report;
  if (!config::LoadNodeConfigFile(config_path, node_config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    std::cerr << "invalid config: " << config_path << '\n';
    PrintIssues(std::cerr, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path << " (role=" << config::RoleName(node_config.role)
            << " local_id=" << static_cast<int>(node_config.local_id)
            << " devices=" << node_config.devices.size() << ")\n";
  return kExitSuccess;
}

int CommandDecode(const std::vector<std::string_view>& args) {
  if (args.empty()) {
    std::cerr << "error: decode requires the frame bytes as hex\n";
    return kExitUsage;
  }

  std::string joined;
  for (const auto arg : args) {
    joined += std::string(arg);
  }

  std::vector<std::uint8_t> bytes;
  std::string error;
  if (!ParseHexBytes(joined, bytes, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  const link::PacketCodec codec;
  link::Frame frame;
  core::errors::LinkError link_error;
  if (!codec.Decode(bytes, frame, link_error)) {
    std::cerr << "error: " << core::errors::FormatLinkError(link_error) << '\n';
    return kExitFailure;
  }

  std::cout << "destination=" << static_cast<int>(frame.destination)
            << (frame.destination == link::kBroadcastId ? " (broadcast)" : "") << '\n'
            << "source=" << static_cast<int>(frame.source) << '\n'
            << "role=" << link::ToString(frame.source_role) << '\n'
            << "command=" << link::ToString(frame.command) << '\n'
            << "sequence=" << frame.sequence << '\n'
            << "payload_bytes=" << frame.payload.size() << '\n';

  if (frame.command == link::CommandKind::kHeartbeat ||
      frame.command == link::CommandKind::kStatusReply) {
    link::CameraStatus status;
    if (!link::DecodeCameraStatus(frame.payload, status, link_error)) {
      std::cerr << "error: " << core::errors::FormatLinkError(link_error) << '\n';
      return kExitFailure;
    }
    std::cout << "recording_state=" << link::ToString(status.recording_state) << '\n'
              << "signal_quality=" << static_cast<int>(status.signal_quality) << '\n'
              << "battery_percent=" << static_cast<int>(status.battery_percent) << '\n'
              << "health=" << link::DescribeHealthFlags(status.health_flags) << '\n'
              << "camera_connected=" << (status.camera_connected ? "true" : "false") << '\n'
              << "camera_asleep=" << (status.camera_asleep ? "true" : "false") << '\n'
              << "last_updated_ms=" << status.last_updated.count() << '\n';
  } else if (frame.command == link::CommandKind::kAck) {
    link::AckPayload ack;
    if (!link::DecodeAckPayload(frame.payload, ack, link_error)) {
      std::cerr << "error: " << core::errors::FormatLinkError(link_error) << '\n';
      return kExitFailure;
    }
    std::cout << "acked_command=" << link::ToString(ack.acked_command) << '\n'
              << "result=" << link::ToString(ack.result) << '\n';
  }
  return kExitSuccess;
}

struct SimulateOptions {
  std::string plan_path;
  fs::path output_dir = "out";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// One plan path, optional `--out <dir>` and `--log-level <level>`.
bool ParseSimulateOptions(const std::vector<std::string_view>& args, SimulateOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--out" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[++i];
      if (token == "--out") {
        options.output_dir = fs::path(std::string(value));
      } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.plan_path.empty()) {
      error = "simulate accepts exactly one plan path";
      return false;
    }
    options.plan_path = std::string(token);
  }

  if (options.plan_path.empty()) {
    error = "simulate requires a plan path";
    return false;
  }
  return true;
}

int CommandSimulate(const std::vector<std::string_view>& args) {
  SimulateOptions options;
  std::string error;
  if (!ParseSimulateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (!ValidateInputPath(options.plan_path, "simulation plan", error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  sim::SimulationPlan plan;
  config::ValidationReport report;
  if (!sim::LoadSimulationPlanFile(options.plan_path, plan, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    std::cerr << "invalid simulation plan: " << options.plan_path << '\n';
    PrintIssues(std::cerr, report);
    return kExitConfigInvalid;
  }

  core::logging::Logger cli_logger(options.log_level, std::cerr);
  cli_logger.SetNodeName("cli");
  cli_logger.Info("simulation starting", {{"plan", plan.name},
                                          {"seed", std::to_string(plan.seed)},
                                          {"duration_ms", std::to_string(plan.duration_ms)},
                                          {"out", options.output_dir.string()}});

  sim::RunOptions run_options;
  run_options.output_dir = options.output_dir;
  run_options.log_level = options.log_level;
  run_options.log_stream = &std::cerr;

  sim::SimulationSummary summary;
  if (!sim::RunSimulation(plan, run_options, summary, error)) {
    cli_logger.Error("simulation aborted", {{"plan", plan.name}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << sim::FormatSessionTable(summary.remote_sessions);
  std::cout << "radio: transmissions=" << summary.radio_transmissions
            << " dropped=" << summary.radio_dropped << " duplicated=" << summary.radio_duplicated
            << " corrupted=" << summary.radio_corrupted << '\n';
  std::cout << "events: " << summary.events_path.string() << " (" << summary.events_written
            << " records)\n";

  if (!summary.expectations_met) {
    std::cout << "expectations failed:\n";
    for (const auto& failure : summary.failures) {
      std::cout << "  - " << failure << '\n';
    }
    return kExitExpectationsFailed;
  }
  std::cout << "expectations met: " << plan.expectations.size() << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "decode") {
    return CommandDecode(args);
  }
  if (command == "simulate") {
    return CommandSimulate(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camlink::cli
