#pragma once

#include <string>

#include "cr/model.hpp"

namespace cr {

class EndpointRegistry;
class CaptureOrchestrator;

// Surface consumed by front-ends (the CLI here).
class CaptureService {
public:
    CaptureService(EndpointRegistry& registry, CaptureOrchestrator& orchestrator, std::string target_hostname);

    ServiceStatus get_status() const;
    TriggerResult trigger_capture();

private:
    EndpointRegistry&    registry_;
    CaptureOrchestrator& orchestrator_;
    std::string          target_hostname_;
};

} // namespace cr
