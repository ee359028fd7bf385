#include "sim/simulation_runner.hpp"

#include "camera/sim/sim_camera_adapter.hpp"
#include "events/emitter.hpp"
#include "events/jsonl_writer.hpp"
#include "link/sim/radio_channel.hpp"
#include "node/controller_node.hpp"
#include "node/remote_node.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

namespace camlink::sim {

namespace {

using core::logging::Logger;

std::string DescribeOutcome(const session::SessionView& view) {
  if (!view.last_outcome.has_value()) {
    return "none";
  }
  return std::string(link::ToString(view.last_outcome->outcome));
}

class Rig {
public:
  Rig(const SimulationPlan& plan, const RunOptions& options)
      : plan_(plan), options_(options), channel_(plan.radio),
        log_stream_(options.log_stream != nullptr ? options.log_stream : &std::cerr) {}

  bool Build(std::string& error) {
    if (!options_.output_dir.empty()) {
      std::filesystem::path log_path;
      if (!events::StartEventLog(options_.output_dir, log_path, error)) {
        return false;
      }
      emitter_.emplace(log_path);
    }

    remote_logger_ = MakeLogger("remote");
    remote_endpoint_ =
        &channel_.AddEndpoint("remote", plan_.remote_signal, plan_.remote.rx_queue_capacity);
    remote_ = std::make_unique<node::RemoteNode>(plan_.remote, *remote_endpoint_, *remote_logger_,
                                                 start_);

    for (const ControllerPlan& controller_plan : plan_.controllers) {
      auto slot = std::make_unique<ControllerSlot>();
      slot->name = controller_plan.name;
      slot->logger = MakeLogger(controller_plan.name);
      slot->endpoint = &channel_.AddEndpoint(controller_plan.name, controller_plan.signal,
                                             controller_plan.node.rx_queue_capacity);
      slot->node = std::make_unique<node::ControllerNode>(controller_plan.node, *slot->endpoint,
                                                          *slot->logger, start_);

      for (const link::DeviceId id : controller_plan.node.devices) {
        auto adapter = std::make_unique<camera::sim::SimCameraAdapter>();
        const auto params = controller_plan.camera_params.find(id);
        if (params != controller_plan.camera_params.end()) {
          for (const auto& [key, value] : params->second) {
            if (!adapter->SetParam(key, value, error)) {
              error = controller_plan.name + " camera " + std::to_string(id) + ": " + error;
              return false;
            }
          }
        }
        if (!slot->node->AttachCamera(id, *adapter, error)) {
          return false;
        }
        slot->cameras.emplace(id, std::move(adapter));
      }
      controllers_.push_back(std::move(slot));
    }

    const events::Emitter::SimStartedEvent started{
        .ts = wall_start_,
        .plan_name = plan_.name,
        .seed = plan_.seed,
        .duration_ms = plan_.duration_ms,
        .controller_count = static_cast<std::uint64_t>(plan_.controllers.size())};
    return Emit([&](std::string& emit_error) {
      return emitter_->EmitSimStarted(started, emit_error);
    }, error);
  }

  bool Run(SimulationSummary& summary, std::string& error) {
    std::size_t next_step = 0;
    for (std::uint64_t t_ms = 0; t_ms <= plan_.duration_ms; t_ms += plan_.tick_ms) {
      const core::TimePoint now = start_ + std::chrono::milliseconds(t_ms);

      while (next_step < plan_.script.size() && plan_.script[next_step].at_ms <= t_ms) {
        if (!ApplyStep(plan_.script[next_step], now, t_ms, summary, error)) {
          return false;
        }
        ++next_step;
      }

      if (!Record("remote", remote_->PollOnce(now), t_ms, error)) {
        return false;
      }
      for (auto& slot : controllers_) {
        if (!Record(slot->name, slot->node->PollOnce(now), t_ms, error)) {
          return false;
        }
      }
    }

    Summarize(summary);
    const events::Emitter::SimFinishedEvent finished{
        .ts = WallTime(plan_.duration_ms),
        .t_ms = plan_.duration_ms,
        .expectations_met = summary.expectations_met,
        .expectation_failures = static_cast<std::uint64_t>(summary.failures.size()),
        .radio_transmissions = channel_.TransmissionCount(),
        .radio_dropped = channel_.DroppedCount()};
    return Emit([&](std::string& emit_error) {
      return emitter_->EmitSimFinished(finished, emit_error);
    }, error);
  }

  std::uint64_t EventsWritten() const {
    return events_written_;
  }

  std::filesystem::path EventsPath() const {
    return emitter_.has_value() ? emitter_->LogPath() : std::filesystem::path();
  }

private:
  struct ControllerSlot {
    std::string name;
    std::unique_ptr<Logger> logger;
    link::sim::RadioEndpoint* endpoint = nullptr;
    std::map<link::DeviceId, std::unique_ptr<camera::sim::SimCameraAdapter>> cameras;
    std::unique_ptr<node::ControllerNode> node;
  };

  std::unique_ptr<Logger> MakeLogger(const std::string& node_name) const {
    auto logger = std::make_unique<Logger>(options_.log_level, *log_stream_);
    logger->SetNodeName(node_name);
    return logger;
  }

  std::chrono::system_clock::time_point WallTime(const std::uint64_t t_ms) const {
    return wall_start_ + std::chrono::milliseconds(t_ms);
  }

  template <typename Fn> bool Emit(Fn&& fn, std::string& error) {
    if (!emitter_.has_value()) {
      return true;
    }
    if (!fn(error)) {
      return false;
    }
    ++events_written_;
    return true;
  }

  bool EmitSubmit(const session::SubmitResult& submit, const std::uint64_t t_ms,
                  SimulationSummary& summary, std::string& error) {
    if (!submit.Accepted()) {
      ++summary.submits_rejected;
    }
    return Emit([&](std::string& emit_error) {
      return emitter_->EmitCommandSubmitted(
          {.ts = WallTime(t_ms), .t_ms = t_ms, .node = "remote", .submit = submit}, emit_error);
    }, error);
  }

  bool ApplyStep(const ScriptStep& step, const core::TimePoint now, const std::uint64_t t_ms,
                 SimulationSummary& summary, std::string& error) {
    remote_logger_->Debug("script step", {{"action", ToString(step.action)},
                                          {"t_ms", std::to_string(t_ms)}});
    switch (step.action) {
    case ScriptStep::Action::kSubmit:
      return EmitSubmit(remote_->Submit(step.device_id, step.command, now), t_ms, summary, error);
    case ScriptStep::Action::kPress:
      return EmitSubmit(remote_->PressButton(step.device_id, now), t_ms, summary, error);
    case ScriptStep::Action::kWakeAll:
      for (const auto& submit : remote_->WakeAll(now)) {
        if (!EmitSubmit(submit, t_ms, summary, error)) {
          return false;
        }
      }
      return true;
    case ScriptStep::Action::kCameraParam: {
      ControllerSlot& slot = *controllers_.at(step.controller);
      const auto camera = slot.cameras.find(step.device_id);
      if (camera == slot.cameras.end()) {
        error = slot.name + " has no camera " + std::to_string(step.device_id);
        return false;
      }
      return camera->second->SetParam(step.key, step.value, error);
    }
    case ScriptStep::Action::kRadioRange:
      controllers_.at(step.controller)->endpoint->SetInRange(step.in_range);
      return true;
    case ScriptStep::Action::kRadioFaults:
      channel_.SetFaults(step.faults);
      return true;
    }
    return true;
  }

  bool Record(const std::string& node_name, const node::LoopReport& report,
              const std::uint64_t t_ms, std::string& error) {
    const auto ts = WallTime(t_ms);
    for (const auto& resolution : report.resolutions) {
      if (!Emit([&](std::string& emit_error) {
            return emitter_->EmitCommandResolved(
                {.ts = ts, .t_ms = t_ms, .node = node_name, .resolution = resolution},
                emit_error);
          }, error)) {
        return false;
      }
    }
    for (const auto& transition : report.transitions) {
      if (!Emit([&](std::string& emit_error) {
            return emitter_->EmitConnectivityChanged(
                {.ts = ts, .t_ms = t_ms, .node = node_name, .transition = transition},
                emit_error);
          }, error)) {
        return false;
      }
    }
    for (const auto& drop : report.drops) {
      if (!Emit([&](std::string& emit_error) {
            return emitter_->EmitFrameDropped(
                {.ts = ts, .t_ms = t_ms, .node = node_name, .drop = drop}, emit_error);
          }, error)) {
        return false;
      }
    }
    for (const auto& execution : report.executions) {
      if (!Emit([&](std::string& emit_error) {
            return emitter_->EmitCameraActuated(
                {.ts = ts, .t_ms = t_ms, .node = node_name, .execution = execution},
                emit_error);
          }, error)) {
        return false;
      }
    }
    return true;
  }

  void Summarize(SimulationSummary& summary) const {
    summary.remote_sessions = remote_->Registry().Snapshot();
    for (const auto& slot : controllers_) {
      for (const auto& [id, adapter] : slot->cameras) {
        summary.camera_actuations[id] += adapter->ActuationCount();
      }
    }
    summary.radio_transmissions = channel_.TransmissionCount();
    summary.radio_dropped = channel_.DroppedCount();
    summary.radio_duplicated = channel_.DuplicatedCount();
    summary.radio_corrupted = channel_.CorruptedCount();

    for (const Expectation& expectation : plan_.expectations) {
      CheckExpectation(expectation, summary);
    }
    summary.expectations_met = summary.failures.empty();
  }

  static void CheckExpectation(const Expectation& expectation, SimulationSummary& summary) {
    const std::string device = "device " + std::to_string(expectation.device_id);
    const session::SessionView* view = nullptr;
    for (const auto& candidate : summary.remote_sessions) {
      if (candidate.device_id == expectation.device_id) {
        view = &candidate;
      }
    }
    if (view == nullptr) {
      summary.failures.push_back(device + ": no session on the remote");
      return;
    }

    const auto mismatch = [&](std::string_view field, std::string_view expected,
                              std::string_view actual) {
      summary.failures.push_back(device + ": expected " + std::string(field) + "=" +
                                 std::string(expected) + ", got " + std::string(actual));
    };

    if (expectation.connectivity.has_value() && *expectation.connectivity != view->connectivity) {
      mismatch("connectivity", session::ToString(*expectation.connectivity),
               session::ToString(view->connectivity));
    }
    if (expectation.last_outcome.has_value() && *expectation.last_outcome != DescribeOutcome(*view)) {
      mismatch("last_outcome", *expectation.last_outcome, DescribeOutcome(*view));
    }
    if (expectation.ack_result.has_value()) {
      if (!view->last_outcome.has_value() ||
          view->last_outcome->outcome != link::DeliveryOutcome::kAcked) {
        mismatch("ack_result", link::ToString(*expectation.ack_result), "no ack");
      } else if (view->last_outcome->result != *expectation.ack_result) {
        mismatch("ack_result", link::ToString(*expectation.ack_result),
                 link::ToString(view->last_outcome->result));
      }
    }
    if (expectation.status_label.has_value() && *expectation.status_label != view->status_label) {
      mismatch("status_label", *expectation.status_label, view->status_label);
    }
    if (expectation.alert.has_value()) {
      const std::string actual =
          view->alert.has_value() ? std::string(session::ToString(view->alert->kind)) : "none";
      if (*expectation.alert != actual) {
        mismatch("alert", *expectation.alert, actual);
      }
    }
    if (expectation.camera_actuations.has_value()) {
      const auto it = summary.camera_actuations.find(expectation.device_id);
      const std::uint64_t actual = it == summary.camera_actuations.end() ? 0U : it->second;
      if (actual != *expectation.camera_actuations) {
        mismatch("camera_actuations", std::to_string(*expectation.camera_actuations),
                 std::to_string(actual));
      }
    }
  }

  const SimulationPlan& plan_;
  RunOptions options_;
  link::sim::RadioChannel channel_;
  std::ostream* log_stream_;
  // Virtual monotonic clock; the offset keeps "time since epoch" arithmetic
  // away from zero.
  const core::TimePoint start_ = core::TimePoint{} + std::chrono::hours(1);
  const std::chrono::system_clock::time_point wall_start_ = std::chrono::system_clock::now();
  std::optional<events::Emitter> emitter_;
  std::uint64_t events_written_ = 0;
  std::unique_ptr<Logger> remote_logger_;
  link::sim::RadioEndpoint* remote_endpoint_ = nullptr;
  std::unique_ptr<node::RemoteNode> remote_;
  std::vector<std::unique_ptr<ControllerSlot>> controllers_;
};

} // namespace

bool RunSimulation(const SimulationPlan& plan, const RunOptions& options,
                   SimulationSummary& summary, std::string& error) {
  summary = SimulationSummary{};
  Rig rig(plan, options);
  if (!rig.Build(error)) {
    return false;
  }
  const bool ran = rig.Run(summary, error);
  summary.events_written = rig.EventsWritten();
  summary.events_path = rig.EventsPath();
  return ran;
}

std::string FormatSessionTable(const std::vector<session::SessionView>& views) {
  std::ostringstream out;
  out << std::left << std::setw(8) << "device" << std::setw(14) << "connectivity"
      << std::setw(8) << "status" << std::setw(8) << "health" << std::setw(14) << "last_outcome"
      << std::setw(15) << "ack_result" << std::setw(19) << "alert" << "rssi_dbm\n";
  for (const auto& view : views) {
    const std::string ack_result =
        view.last_outcome.has_value() &&
                view.last_outcome->outcome == link::DeliveryOutcome::kAcked
            ? std::string(link::ToString(view.last_outcome->result))
            : "-";
    const std::string alert =
        view.alert.has_value() ? std::string(session::ToString(view.alert->kind)) : "-";
    out << std::left << std::setw(8) << static_cast<int>(view.device_id) << std::setw(14)
        << session::ToString(view.connectivity) << std::setw(8) << view.status_label
        << std::setw(8) << (view.health_label.empty() ? "-" : view.health_label) << std::setw(14)
        << DescribeOutcome(view) << std::setw(15) << ack_result << std::setw(19) << alert
        << view.signal.rssi_dbm << '\n';
  }
  return out.str();
}

} // namespace camlink::sim
