#pragma once
// =============================================================================
// PrinterHub - Protocol Client Interface
// =============================================================================
// The wire protocols themselves live outside the engine. A ProtocolClient is
// one open channel to one printer; backends translate high-level operations
// into call()s on it and normalize the JSON replies.
//
// Channels:
//   legacy - single TCP command channel every family speaks (G/M-codes)
//   modern - HTTP API of the 5M family (status, jobs, thumbnails, material)
// =============================================================================

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "printer_types.hpp"
#include "result.hpp"

namespace printerhub {

template<typename T>
using Completion = std::function<void(Result<T>)>;

class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    // Issue one request. `done` is invoked exactly once, on the scheduler
    // thread (clients doing I/O elsewhere hand the result back with
    // Scheduler::post). Errors: Connection when unreachable, ExecutionFailed
    // when the printer rejects or times out the request.
    virtual void call(const std::string& method, const nlohmann::json& params,
                      Completion<nlohmann::json> done) = 0;

    // Drop the channel. Calls still outstanding complete with a Connection error.
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

// Supplied by the connection flow: opens channels for a device.
class ClientFactory {
public:
    virtual ~ClientFactory() = default;

    virtual Result<std::unique_ptr<ProtocolClient>> openLegacy(const DeviceDetails& details) = 0;
    virtual Result<std::unique_ptr<ProtocolClient>> openModern(const DeviceDetails& details) = 0;
};

} // namespace printerhub
