#pragma once
/**
 * @file capability_api.hpp
 * @brief Base class of all domain façades registered in the Broker.
 *
 * Contract shared by every capability:
 *  - getters return deep copies, never references into internal state;
 *  - setters delegate persistence to an owning module and return ApiStatus;
 *  - device commands validate first, then dispatch, and convert adapter
 *    exceptions to failures reported on the status channel.
 */

#include "broker/errors.hpp"

#include <string>

namespace elworkbench::broker
{

class Broker;
class StatusChannel;

class CapabilityApi
{
  public:
    CapabilityApi(std::string name, Broker &broker);
    virtual ~CapabilityApi() = default;

    CapabilityApi(const CapabilityApi &) = delete;
    CapabilityApi &operator=(const CapabilityApi &) = delete;

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }

  protected:
    [[nodiscard]] Broker &broker() const noexcept { return m_broker; }
    [[nodiscard]] StatusChannel &status() const;

    /**
     * @brief Report a failure on the status channel and return it.
     *
     * Validation, busy, cancellation, not-ready and no-selection failures are
     * reported as warnings; communication, I/O and malformed-record failures
     * as errors. The message is prefixed with this capability's name.
     */
    template <typename T = void>
    [[nodiscard]] ApiResult<T> report_failure(ErrorKind kind, const std::string &detail) const
    {
        auto result = failure<T>(kind, detail);
        publish_failure(kind, result.message());
        return result;
    }

    /// Publish a failure built earlier with failure(); @p message carries the kind prefix.
    void publish_failure(ErrorKind kind, const std::string &message) const;

  private:
    std::string m_name;
    Broker &m_broker;
};

} // namespace elworkbench::broker
