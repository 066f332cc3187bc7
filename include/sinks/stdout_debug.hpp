#pragma once

#include "model/telemetry.hpp"

namespace factory_sim::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::ControllerTelemetry& telemetry) const;
  void publish(const model::SortingSummary& summary) const;
};

}  // namespace factory_sim::sinks
