#include <sig-vault/backend_adapter.hpp>
#include <sig-vault/cloud_adapter.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/smb_adapter.hpp>

namespace SigVault
{

std::shared_ptr<BackendAdapter> createBackendAdapter(const BackendConfig &backend, const TransferConfig &transfers)
{
    switch (backend.kind)
    {
    case BackendKind::SMB:
        Logger::debug(LogCategory::BACKEND, "Creating SMB adapter for {}", backend.qualifiedId());
        return std::make_shared<SmbAdapter>(backend, transfers);
    case BackendKind::CLOUD:
        Logger::debug(LogCategory::BACKEND, "Creating cloud adapter for {}", backend.qualifiedId());
        return std::make_shared<CloudAdapter>(backend, transfers);
    }
    return nullptr;
}

} // namespace SigVault
