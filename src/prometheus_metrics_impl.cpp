#include <sig-vault/prometheus_metrics_impl.hpp>
#include <fmt/format.h>
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace SigVault
{

namespace
{
constexpr std::size_t EXPOSER_THREADS = 2;

prometheus::Gauge &addGauge(prometheus::Registry &registry, const std::string &name, const std::string &help)
{
    return prometheus::BuildGauge().Name(name).Help(help).Register(registry).Add({});
}

prometheus::Family<prometheus::Counter> &
addCounterFamily(prometheus::Registry &registry, const std::string &name, const std::string &help)
{
    return prometheus::BuildCounter().Name(name).Help(help).Register(registry);
}
} // namespace

PrometheusMetricsImpl::PrometheusMetricsImpl(const MetricsConfig &config)
: config(config), registry(std::make_shared<prometheus::Registry>())
{
    exposer = std::make_unique<prometheus::Exposer>(fmt::format("{}:{}", config.bind_address, config.port),
                                                    EXPOSER_THREADS);

    cache_lookups = &addCounterFamily(*registry, "sig_vault_cache_lookups_total",
                                      "Download requests checked against the local cache, by outcome");
    cache_evictions = &addCounterFamily(*registry, "sig_vault_cache_evictions_total",
                                        "Cache files removed to stay under the size bound")
                       .Add({});
    cache_bytes = &addGauge(*registry, "sig_vault_cache_bytes", "Bytes held by cached files");
    cache_entries = &addGauge(*registry, "sig_vault_cache_entries", "Number of cache records");

    transfers_submitted =
    &addCounterFamily(*registry, "sig_vault_transfers_submitted_total", "Transfer jobs accepted by the engine");
    transfers_finished = &addCounterFamily(*registry, "sig_vault_transfers_finished_total",
                                           "Transfer jobs that reached a terminal state");
    transfers_active = &addGauge(*registry, "sig_vault_transfers_active", "Jobs currently held by a worker");
    transfers_pending = &addGauge(*registry, "sig_vault_transfers_pending", "Jobs waiting for a worker");
    transfer_seconds = &prometheus::BuildHistogram()
                        .Name("sig_vault_transfer_duration_seconds")
                        .Help("Wall time of successful transfers")
                        .Register(*registry)
                        .Add({}, prometheus::Histogram::BucketBoundaries{ 0.1, 0.5, 1.0, 5.0, 15.0, 60.0, 300.0, 900.0 });

    backend_operations = &addCounterFamily(*registry, "sig_vault_backend_operations_total",
                                           "Adapter calls by backend, operation and status code");

    exposer->RegisterCollectable(registry, config.endpoint_path);
}

PrometheusMetricsImpl::~PrometheusMetricsImpl() = default;

void PrometheusMetricsImpl::recordCacheHit()
{
    cache_lookups->Add({ { "outcome", "hit" } }).Increment();
}

void PrometheusMetricsImpl::recordCacheMiss()
{
    cache_lookups->Add({ { "outcome", "miss" } }).Increment();
}

void PrometheusMetricsImpl::recordCacheEviction()
{
    cache_evictions->Increment();
}

void PrometheusMetricsImpl::setCacheBytes(double bytes)
{
    cache_bytes->Set(bytes);
}

void PrometheusMetricsImpl::setCacheEntries(double entries)
{
    cache_entries->Set(entries);
}

void PrometheusMetricsImpl::recordTransferSubmitted(std::string_view direction)
{
    transfers_submitted->Add({ { "direction", std::string(direction) } }).Increment();
}

void PrometheusMetricsImpl::recordTransferCompleted(std::string_view direction, double duration_seconds)
{
    transfers_finished->Add({ { "direction", std::string(direction) }, { "state", "SUCCEEDED" } }).Increment();
    transfer_seconds->Observe(duration_seconds);
}

void PrometheusMetricsImpl::recordTransferFailed(std::string_view direction, std::string_view reason)
{
    transfers_finished
    ->Add({ { "direction", std::string(direction) }, { "state", "FAILED" }, { "reason", std::string(reason) } })
    .Increment();
}

void PrometheusMetricsImpl::recordTransferCancelled()
{
    transfers_finished->Add({ { "state", "CANCELLED" } }).Increment();
}

void PrometheusMetricsImpl::setActiveTransfers(double count)
{
    transfers_active->Set(count);
}

void PrometheusMetricsImpl::setPendingTransfers(double count)
{
    transfers_pending->Set(count);
}

void PrometheusMetricsImpl::recordBackendOperation(std::string_view backend, std::string_view operation,
                                                   std::string_view result)
{
    backend_operations
    ->Add({ { "backend", std::string(backend) }, { "operation", std::string(operation) }, { "result", std::string(result) } })
    .Increment();
}

std::string PrometheusMetricsImpl::getMetricsUrl() const
{
    return fmt::format("http://{}:{}{}", config.bind_address, config.port, config.endpoint_path);
}

} // namespace SigVault
