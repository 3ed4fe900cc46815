#pragma once

#include <cleanbench/config/run_config.h>
#include <cleanbench/core/types.h>
#include <cleanbench/net/http_client.h>
#include <cleanbench/process/process_registry.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cleanbench::process {

/**
 * @brief One running instance of the service under test
 */
struct ServiceInstance {
    int64_t pid{-1};
    std::string host;
    int port{0};

    std::string baseUrl() const { return "http://" + host + ":" + std::to_string(port); }
};

/**
 * @brief Capability set the orchestrator needs from the service under test
 */
class IServiceDriver {
public:
    virtual ~IServiceDriver() = default;

    // Launch without waiting for readiness
    virtual Result<ServiceInstance> spawn(const config::RunConfiguration& config) = 0;

    // false on timeout or early exit; never throws for either
    virtual bool awaitHealthy(const ServiceInstance& instance,
                              std::chrono::milliseconds timeout) = 0;

    // Idempotent
    virtual void terminate(const ServiceInstance& instance) = 0;

    // Returns the number of orphaned processes signalled
    virtual size_t sweepOrphans() = 0;

    virtual void terminateAll() = 0;
};

struct LifecycleOptions {
    std::string healthPath{"/health"};
    std::string signature; ///< Launch command whose argv identifies our services
    std::chrono::milliseconds gracePeriod{std::chrono::seconds{5}};
    std::chrono::milliseconds pollInterval{std::chrono::seconds{1}};
    std::chrono::milliseconds probeTimeout{std::chrono::seconds{1}};
    std::filesystem::path procRoot{"/proc"};

    static LifecycleOptions fromConfig(const config::RunConfiguration& config);
};

// True when argv runs the signature's program with the signature's leading arguments,
// directly, through an interpreter or via "-m". Only the program name is compared by basename.
bool matchesLaunchSignature(const std::vector<std::string>& argv,
                            const std::vector<std::string>& signature);

/**
 * @brief Spawns, health-checks and tears down service processes on the local host
 *
 * Every spawned process is held in the owned ProcessRegistry until terminate() or
 * terminateAll() removes it; the destructor drains whatever is left.
 */
class ProcessLifecycleManager final : public IServiceDriver {
public:
    ProcessLifecycleManager(std::shared_ptr<net::IHttpClient> http, LifecycleOptions options);
    ~ProcessLifecycleManager() override;

    ProcessLifecycleManager(const ProcessLifecycleManager&) = delete;
    ProcessLifecycleManager& operator=(const ProcessLifecycleManager&) = delete;

    Result<ServiceInstance> spawn(const config::RunConfiguration& config) override;
    bool awaitHealthy(const ServiceInstance& instance, std::chrono::milliseconds timeout) override;
    void terminate(const ServiceInstance& instance) override;
    size_t sweepOrphans() override;
    void terminateAll() override;

    ProcessRegistry& registry() noexcept { return registry_; }
    const ProcessRegistry& registry() const noexcept { return registry_; }

private:
    bool killOrphan(int64_t pid);

    std::shared_ptr<net::IHttpClient> http_;
    LifecycleOptions options_;
    ProcessRegistry registry_;
};

} // namespace cleanbench::process
