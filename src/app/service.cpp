#include "cr/service.hpp"

#include "cr/orchestrator.hpp"
#include "cr/registry.hpp"

namespace cr {

CaptureService::CaptureService(EndpointRegistry& registry,
                               CaptureOrchestrator& orchestrator,
                               std::string target_hostname)
    : registry_(registry),
      orchestrator_(orchestrator),
      target_hostname_(std::move(target_hostname))
{}

ServiceStatus CaptureService::get_status() const
{
    const Endpoint ep = registry_.snapshot();
    ServiceStatus st{};
    st.discovered = ep.known();
    st.url = ep.capture_url;
    st.target_hostname = target_hostname_ + ".local";
    return st;
}

TriggerResult CaptureService::trigger_capture()
{
    return orchestrator_.trigger();
}

} // namespace cr
