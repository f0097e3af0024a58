#include "broker/capability_api.hpp"
#include "broker/broker.hpp"

#include <fmt/format.h>

namespace elworkbench::broker
{

CapabilityApi::CapabilityApi(std::string name, Broker &broker)
    : m_name(std::move(name)), m_broker(broker)
{
}

StatusChannel &CapabilityApi::status() const
{
    return m_broker.status();
}

void CapabilityApi::publish_failure(ErrorKind kind, const std::string &message) const
{
    Severity severity = Severity::Warning;
    switch (kind)
    {
    case ErrorKind::DeviceCommunication:
    case ErrorKind::Io:
    case ErrorKind::MalformedRecord: severity = Severity::Error; break;
    case ErrorKind::Validation:
    case ErrorKind::DeviceNotReady:
    case ErrorKind::DeviceBusy:
    case ErrorKind::Cancelled:
    case ErrorKind::NoSelection: severity = Severity::Warning; break;
    }
    m_broker.status().report(severity, fmt::format("[{}] {}", m_name, message));
}

} // namespace elworkbench::broker
