#include <sig-vault/metrics_collector.hpp>
#include <sig-vault/logger.hpp>

namespace SigVault
{

namespace
{
const char *backendLabel(BackendKind kind)
{
    return kind == BackendKind::SMB ? "smb" : "cloud";
}
} // namespace

MetricsCollector::MetricsCollector(const MetricsConfig &config)
{
    if (config.enabled)
    {
        registry = std::make_unique<PrometheusMetricsImpl>(config);
    }
}

void MetricsCollector::recordTransferSubmitted(TransferDirection direction)
{
    forward(&PrometheusMetricsImpl::recordTransferSubmitted, transferDirectionToString(direction));
}

void MetricsCollector::recordTransferCompleted(TransferDirection direction, double duration_seconds)
{
    forward(&PrometheusMetricsImpl::recordTransferCompleted, transferDirectionToString(direction), duration_seconds);
}

void MetricsCollector::recordTransferFailed(TransferDirection direction, StatusCode reason)
{
    forward(&PrometheusMetricsImpl::recordTransferFailed, transferDirectionToString(direction),
            statusCodeToString(reason));
}

void MetricsCollector::recordBackendOperation(BackendKind backend, std::string_view operation, StatusCode result)
{
    forward(&PrometheusMetricsImpl::recordBackendOperation, backendLabel(backend), operation,
            statusCodeToString(result));
}

std::string MetricsCollector::getMetricsUrl() const
{
    return registry ? registry->getMetricsUrl() : "metrics disabled";
}

std::unique_ptr<MetricsCollector> GlobalMetrics::metrics_instance;
std::mutex GlobalMetrics::instance_mutex;

MetricsCollector &GlobalMetrics::instance()
{
    static MetricsCollector disabled(MetricsConfig{});

    std::lock_guard<std::mutex> lock(instance_mutex);
    return metrics_instance ? *metrics_instance : disabled;
}

void GlobalMetrics::initialize(const MetricsConfig &config)
{
    std::lock_guard<std::mutex> lock(instance_mutex);
    metrics_instance.reset();

    if (!config.enabled)
    {
        Logger::debug(LogCategory::METRICS, "Metrics disabled in configuration");
        return;
    }

    try
    {
        metrics_instance = std::make_unique<MetricsCollector>(config);
        Logger::info(LogCategory::METRICS, "Serving metrics at {}", metrics_instance->getMetricsUrl());
    }
    catch (const std::exception &e)
    {
        // A busy port must not stop the vault from working
        Logger::error(LogCategory::METRICS, "Cannot start metrics exposer on {}:{}: {}", config.bind_address,
                      config.port, e.what());
    }
}

void GlobalMetrics::shutdown()
{
    std::lock_guard<std::mutex> lock(instance_mutex);
    if (metrics_instance)
    {
        Logger::debug(LogCategory::METRICS, "Stopping metrics exposer");
        metrics_instance.reset();
    }
}

} // namespace SigVault
