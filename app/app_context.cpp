#include "app_context.hpp"
#include "auth/local_backend.hpp"
#include "auth/remote_backend.hpp"
#include "logger.hpp"
#include "vault/sqlite_vault.hpp"

#include <format>

std::expected<std::unique_ptr<AppContext>, std::string>
AppContext::create(const Config& config, std::unique_ptr<auth::BiometricPlatform> platform)
{
    const auto& log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        return std::unexpected(std::format("Failed to initialize logger: {}", result.error()));
    }

    auto opened = vault::SqliteVault::open(config.vault().path, config.vault().key_file);
    if (!opened)
    {
        return std::unexpected(std::format("Failed to open vault: {}", opened.error()));
    }
    auto vlt = std::make_unique<vault::SqliteVault>(std::move(*opened));

    std::unique_ptr<auth::IdentityBackend> backend;
    const auto& be_cfg = config.backend();
    if (be_cfg.mode == Config::BackendMode::Remote)
    {
        auto remote = auth::RemoteBackend::create(be_cfg.base_url, be_cfg.timeout);
        if (!remote)
        {
            return std::unexpected(std::format("Invalid backend: {}", remote.error()));
        }
        backend = std::make_unique<auth::RemoteBackend>(std::move(*remote));
        LOG_INFO("Using remote identity backend at {}", be_cfg.base_url);
    }
    else
    {
        auto local = auth::LocalBackend::open(be_cfg.db_path);
        if (!local)
        {
            return std::unexpected(std::format("Failed to open user database: {}", local.error()));
        }
        backend = std::make_unique<auth::LocalBackend>(std::move(*local));
        LOG_INFO("Using local identity backend at {}", be_cfg.db_path);
    }

    if (!platform)
    {
        platform = std::make_unique<auth::UnsupportedBiometricPlatform>();
    }

    auto ctx = std::make_unique<AppContext>(private_tag{}, config, std::move(vlt),
                                            std::move(backend), std::move(platform));
    ctx->ctrl->initialize();
    return ctx;
}

AppContext::AppContext(private_tag, Config config, std::unique_ptr<vault::CredentialVault> v,
                       std::unique_ptr<auth::IdentityBackend> be,
                       std::unique_ptr<auth::BiometricPlatform> plat)
    : cfg(std::move(config))
    , vlt(std::move(v))
    , backend(std::move(be))
    , platform(std::move(plat))
{
    store = std::make_unique<vault::SecureStore>(*vlt);
    prompt_pool = std::make_unique<ThreadPool>(1);
    dev = std::make_unique<auth::DeviceIdentity>(*store);

    const auto& pc = cfg.pin();
    pin_fb = std::make_unique<auth::PinFallback>(*store, clock,
        auth::PinFallback::Settings{pc.max_attempts, pc.lockout_duration, pc.min_length, pc.max_length});

    const auto& bc = cfg.biometric();
    gate = std::make_unique<auth::BiometricGate>(*store, *platform, *pin_fb, *prompt_pool, clock,
        auth::BiometricGate::Settings{bc.max_attempts, bc.reset_window, bc.prompt_timeout});

    const auto& ac = cfg.auth();
    orch = std::make_unique<auth::AuthOrchestrator>(*store, *backend, *gate, *pin_fb, *dev, stats,
        auth::AuthOrchestrator::Settings{ac.password_min_length, ac.probe_connectivity});

    ctrl = std::make_unique<auth::LockoutController>(*store, *orch, *gate, *pin_fb, stats);

    LOG_INFO("Engine ready on device {}", dev->device_id());
}

AppContext::~AppContext()
{
    prompt_pool->stop();
    LOG_INFO("{}", stats);
}
