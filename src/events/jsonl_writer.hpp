#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace camlink::events {

// Creates `output_dir` if needed and starts an empty
// `<output_dir>/events.jsonl`, discarding a previous run's timeline.
bool StartEventLog(const std::filesystem::path& output_dir, std::filesystem::path& log_path,
                   std::string& error);

// Appends exactly one JSON line to an event log started above.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& log_path,
                      std::string& error);

} // namespace camlink::events
