#pragma once

#include "../types/config.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace prometheus
{
class Registry;
class Exposer;
template <typename T>
class Family;
class Counter;
class Gauge;
class Histogram;
} // namespace prometheus

namespace SigVault
{

// Owns the exposer and the metric families. Throws from the constructor
// when the exposer cannot bind.
class PrometheusMetricsImpl
{
    public:
    explicit PrometheusMetricsImpl(const MetricsConfig &config);
    ~PrometheusMetricsImpl();

    void recordCacheHit();
    void recordCacheMiss();
    void recordCacheEviction();
    void setCacheBytes(double bytes);
    void setCacheEntries(double entries);

    void recordTransferSubmitted(std::string_view direction);
    void recordTransferCompleted(std::string_view direction, double duration_seconds);
    void recordTransferFailed(std::string_view direction, std::string_view reason);
    void recordTransferCancelled();
    void setActiveTransfers(double count);
    void setPendingTransfers(double count);

    void recordBackendOperation(std::string_view backend, std::string_view operation, std::string_view result);

    std::string getMetricsUrl() const;

    private:
    MetricsConfig config;
    std::unique_ptr<prometheus::Exposer> exposer;
    std::shared_ptr<prometheus::Registry> registry;

    prometheus::Family<prometheus::Counter> *cache_lookups{};
    prometheus::Counter *cache_evictions{};
    prometheus::Gauge *cache_bytes{};
    prometheus::Gauge *cache_entries{};

    prometheus::Family<prometheus::Counter> *transfers_submitted{};
    prometheus::Family<prometheus::Counter> *transfers_finished{};
    prometheus::Gauge *transfers_active{};
    prometheus::Gauge *transfers_pending{};
    prometheus::Histogram *transfer_seconds{};

    prometheus::Family<prometheus::Counter> *backend_operations{};
};

} // namespace SigVault
