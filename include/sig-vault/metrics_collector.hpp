#pragma once

#include "../types/config.hpp"
#include "../types/transfer_job.hpp"
#include "prometheus_metrics_impl.hpp"
#include "vault_status.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace SigVault
{

// Typed front for the Prometheus registry. Built with metrics disabled it
// holds no registry and every record call returns immediately.
class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &config);

    MetricsCollector(const MetricsCollector &) = delete;
    MetricsCollector &operator=(const MetricsCollector &) = delete;

    void recordCacheHit()
    {
        forward(&PrometheusMetricsImpl::recordCacheHit);
    }

    void recordCacheMiss()
    {
        forward(&PrometheusMetricsImpl::recordCacheMiss);
    }

    void recordCacheEviction()
    {
        forward(&PrometheusMetricsImpl::recordCacheEviction);
    }

    void updateCacheSize(uint64_t bytes)
    {
        forward(&PrometheusMetricsImpl::setCacheBytes, static_cast<double>(bytes));
    }

    void updateCacheEntryCount(size_t count)
    {
        forward(&PrometheusMetricsImpl::setCacheEntries, static_cast<double>(count));
    }

    void recordTransferSubmitted(TransferDirection direction);
    void recordTransferCompleted(TransferDirection direction, double duration_seconds);
    void recordTransferFailed(TransferDirection direction, StatusCode reason);

    void recordTransferCancelled()
    {
        forward(&PrometheusMetricsImpl::recordTransferCancelled);
    }

    void updateActiveTransfers(size_t count)
    {
        forward(&PrometheusMetricsImpl::setActiveTransfers, static_cast<double>(count));
    }

    void updatePendingTransfers(size_t count)
    {
        forward(&PrometheusMetricsImpl::setPendingTransfers, static_cast<double>(count));
    }

    // One adapter call, labelled by backend kind, operation and resulting status code
    void recordBackendOperation(BackendKind backend, std::string_view operation, StatusCode result);

    bool isEnabled() const
    {
        return registry != nullptr;
    }

    std::string getMetricsUrl() const;

    private:
    template <typename Method, typename... Args>
    void forward(Method method, Args &&...args)
    {
        if (registry)
        {
            ((*registry).*method)(std::forward<Args>(args)...);
        }
    }

    std::unique_ptr<PrometheusMetricsImpl> registry;
};

// Process wide collector. Until initialize() succeeds with metrics enabled,
// instance() hands out a disabled collector so library code can record
// unconditionally.
class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &config);
    static void shutdown();
    static MetricsCollector &instance();

    private:
    static std::unique_ptr<MetricsCollector> metrics_instance;
    static std::mutex instance_mutex;
};

} // namespace SigVault
