#include "controlhub/core/control_hub.hpp"
#include "controlhub/process/supervisor_client.hpp"
#include "controlhub/utils/file_io.hpp"
#include "controlhub/utils/logging.hpp"

#include <algorithm>

namespace scoreboard::controlhub {

DECLARE_LOGGER("ControlHub");

namespace fs = std::filesystem;

namespace {

std::unique_ptr<HealthProbe> make_probe(const HubSettings& settings, ProcessController& controller) {
    const auto& health = settings.health_check();
    if (health.probe == "tcp") {
        return std::make_unique<TcpHealthProbe>(health.host, health.port, Milliseconds(health.interval_ms));
    }
    return std::make_unique<SupervisorStateProbe>(controller, settings.target_process(), health.stable_checks);
}

std::unique_ptr<ProcessController> make_supervisor(const HubSettings& settings) {
    SupervisorClient::Options options;
    options.request_timeout = Milliseconds(settings.supervisor().request_timeout_ms);
    return std::make_unique<SupervisorClient>(
        std::make_unique<CurlTransport>(settings.supervisor().host, settings.supervisor().port), options);
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Parses `path`, fills defaults and checks it against `schema`.
std::optional<ConfigDocument> try_seed_from(const fs::path& path, const ConfigSchema& schema) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    auto text = utils::read_file(path);
    if (!text) {
        COMPONENT_LOG_WARN("Cannot read {}: {}", path.string(), text.error().message());
        return std::nullopt;
    }
    auto document = ConfigDocument::parse(text.value());
    if (!document) {
        COMPONENT_LOG_WARN("Ignoring {} as seed: {}", path.string(), document.error().message());
        return std::nullopt;
    }

    ConfigDocument candidate = std::move(document).value();
    candidate.erase(ConfigDocument::kReservedSection);
    schema.apply_defaults(candidate);
    if (auto valid = schema.validate(candidate); !valid) {
        COMPONENT_LOG_WARN("Ignoring {} as seed: {}", path.string(), valid.error().message());
        return std::nullopt;
    }
    return candidate;
}

}  // namespace

const char* hub_state_to_string(HubState state) {
    switch (state) {
        case HubState::UNINITIALIZED: return "uninitialized";
        case HubState::READY: return "ready";
        case HubState::SHUTDOWN: return "shutdown";
        case HubState::ERROR: return "error";
    }
    return "unknown";
}

ControlHub::ControlHub(const HubSettings& settings)
    : ControlHub(settings, make_supervisor(settings), nullptr) {}

ControlHub::ControlHub(const HubSettings& settings,
                       std::unique_ptr<ProcessController> controller,
                       std::unique_ptr<HealthProbe> probe)
    : settings_(settings),
      paths_(settings.paths()),
      schema_(ConfigSchema::scoreboard_defaults()),
      controller_(std::move(controller)),
      probe_(std::move(probe)) {
    ConfigStorePaths store_paths;
    store_paths.canonical = paths_.canonical_config;
    store_paths.staging_dir = paths_.staging_dir;
    store_paths.live = paths_.live_config;
    store_paths.max_backups = settings_.config_store().max_backups;
    store_ = std::make_unique<ConfigStore>(store_paths);

    trees_ = std::make_unique<PluginTreeStore>(paths_.plugin_root, paths_.plugin_staging);
    packages_ = std::make_unique<DirectoryPackageSource>(paths_.package_dir);

    if (!probe_) {
        probe_ = make_probe(settings_, *controller_);
    }

    OrchestratorOptions options;
    options.target_process = settings_.target_process();
    options.restart_timeout = Milliseconds(settings_.restart_timeout_ms());
    options.health = health_policy(settings_.health_check());
    options.plugins_file = paths_.plugins_file;
    options.lock_file = paths_.lock_file;
    orchestrator_ = std::make_unique<Orchestrator>(*store_, schema_, *trees_, *controller_, *probe_,
                                                   std::move(options));
}

ControlHub::~ControlHub() {
    if (get_state() == HubState::READY) {
        auto stopped = shutdown();
        if (!stopped) {
            COMPONENT_LOG_WARN("Shutdown failed: {}", stopped.error().message());
        }
    }
}

HealthPolicy ControlHub::health_policy(const HubSettings::HealthCheckConfig& config) {
    HealthPolicy policy;
    policy.attempts = config.attempts;
    policy.interval = Milliseconds(config.interval_ms);
    policy.max_interval = Milliseconds(config.max_interval_ms);
    policy.timeout = Milliseconds(config.timeout_ms);
    return policy;
}

Result<void> ControlHub::initialize() {
    std::lock_guard lock(state_mutex_);
    if (state_ == HubState::READY) {
        return unexpected(MAKE_ERROR(ALREADY_INITIALIZED, "Control hub already initialized"));
    }

    COMPONENT_LOG_INFO("Initializing control hub for {}", paths_.scoreboard_dir.string());

    auto prepared = utils::ensure_directory(paths_.canonical_config.parent_path());
    if (prepared) {
        prepared = utils::ensure_directory(paths_.plugin_root);
    }
    if (!prepared) {
        state_ = HubState::ERROR;
        return prepared;
    }

    bool seeded_now = false;
    if (!store_->read()) {
        COMPONENT_LOG_INFO("No usable canonical configuration, seeding a new one");
        auto seeded = store_->seed(seed_document(paths_, schema_));
        if (!seeded) {
            state_ = HubState::ERROR;
            return unexpected(std::move(seeded).error());
        }
        seeded_now = true;
    }

    // A fresh seed came from the live file, so only drift on an existing install warrants a restart.
    auto recovered = orchestrator_->recover(!seeded_now);
    if (recovered) {
        for (const auto& id : recovered->quarantined) {
            COMPONENT_LOG_WARN("Plugin tree '{}' had no record and was moved to .orphaned", id);
        }
        if (recovered->restarted) {
            COMPONENT_LOG_INFO("Restarted '{}' on the republished configuration", settings_.target_process());
        }
    } else if (recovered.error().code() == ErrorCode::TRANSACTION_BUSY) {
        COMPONENT_LOG_INFO("Skipping start-up recovery while another change is being applied");
        auto loaded = orchestrator_->load();
        if (!loaded) {
            state_ = HubState::ERROR;
            return loaded;
        }
    } else {
        state_ = HubState::ERROR;
        return unexpected(std::move(recovered).error());
    }

    state_ = HubState::READY;
    COMPONENT_LOG_INFO("Control hub ready (scoreboard {}, target '{}')", scoreboard_version(),
                       settings_.target_process());
    return {};
}

Result<void> ControlHub::shutdown() {
    std::lock_guard lock(state_mutex_);
    if (state_ == HubState::SHUTDOWN) {
        return {};
    }
    if (orchestrator_->cancel()) {
        COMPONENT_LOG_INFO("Cancelled the in-flight transaction for shutdown");
    }
    state_ = HubState::SHUTDOWN;
    COMPONENT_LOG_INFO("Control hub shut down");
    return {};
}

HubState ControlHub::get_state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

Result<void> ControlHub::require_ready() const {
    if (get_state() != HubState::READY) {
        return unexpected(MAKE_ERROR(NOT_INITIALIZED, "Control hub is not initialized"));
    }
    return {};
}

ConfigDocument ControlHub::seed_document(const HubSettings::Paths& paths, const ConfigSchema& schema) {
    if (auto live = try_seed_from(paths.live_config, schema)) {
        COMPONENT_LOG_INFO("Seeding from live configuration {}", paths.live_config.string());
        return *live;
    }
    if (auto sample = try_seed_from(paths.sample_config, schema)) {
        COMPONENT_LOG_INFO("Seeding from sample configuration {}", paths.sample_config.string());
        return *sample;
    }
    COMPONENT_LOG_INFO("Seeding from schema defaults");
    return schema.make_default_document();
}

Result<TransactionOutcome> ControlHub::apply_change(const Mutation& mutation) {
    RETURN_IF_ERROR(require_ready());
    return orchestrator_->apply_change(mutation);
}

Result<PluginPackage> ControlHub::resolve_package(const std::string& source) const {
    std::error_code ec;
    const fs::path directory(source);
    if (fs::is_regular_file(directory / PluginManifest::kFileName, ec)) {
        return DirectoryPackageSource::load_directory(directory);
    }
    return packages_->fetch(source);
}

Result<TransactionOutcome> ControlHub::install_package(const std::string& source) {
    RETURN_IF_ERROR(require_ready());
    PluginPackage package;
    ASSIGN_OR_RETURN(package, resolve_package(source));
    return orchestrator_->apply_change(InstallPlugin{std::move(package.manifest), std::move(package.files)});
}

Result<TransactionOutcome> ControlHub::update_package(const std::string& source) {
    RETURN_IF_ERROR(require_ready());
    PluginPackage package;
    ASSIGN_OR_RETURN(package, resolve_package(source));
    return orchestrator_->apply_change(UpdatePlugin{std::move(package.manifest), std::move(package.files)});
}

bool ControlHub::cancel() {
    return orchestrator_->cancel();
}

std::vector<PluginRecord> ControlHub::list_plugins() const {
    return orchestrator_->list_plugins();
}

Result<ConfigDocument> ControlHub::read_config() const {
    return orchestrator_->read_config();
}

std::vector<std::string> ControlHub::boards() const {
    return orchestrator_->boards();
}

HubStatus ControlHub::status() {
    HubStatus status;
    status.hub_version = CONTROLHUB_VERSION;
    status.scoreboard_version = scoreboard_version();
    status.target_process = settings_.target_process();
    status.transaction_in_flight = orchestrator_->busy();

    if (auto document = store_->read()) {
        status.config_version = document->version();
    }

    const auto plugins = orchestrator_->list_plugins();
    status.plugin_count = plugins.size();
    status.enabled_plugin_count = static_cast<size_t>(std::count_if(plugins.begin(), plugins.end(),
        [](const PluginRecord& record) { return record.state == PluginState::Enabled; }));

    status.supervisor_available = controller_->is_available();
    if (status.supervisor_available) {
        auto target = controller_->status(settings_.target_process());
        if (target) {
            status.target_status = target.value();
        } else {
            COMPONENT_LOG_DEBUG("Status of '{}' unavailable: {}", settings_.target_process(),
                                target.error().message());
        }
    }
    return status;
}

Result<std::vector<ProcessInfo>> ControlHub::processes() {
    return controller_->list_processes();
}

Result<void> ControlHub::start_process(const std::string& name) {
    return orchestrator_->run_exclusive([this, &name]() -> Result<void> {
        COMPONENT_LOG_INFO("Starting '{}'", name);
        return controller_->start(name);
    });
}

Result<void> ControlHub::stop_process(const std::string& name) {
    return orchestrator_->run_exclusive([this, &name]() -> Result<void> {
        COMPONENT_LOG_INFO("Stopping '{}'", name);
        return controller_->stop(name);
    });
}

std::string ControlHub::scoreboard_version() const {
    std::error_code ec;
    if (!fs::is_regular_file(paths_.version_file, ec)) {
        return "unknown";
    }
    auto text = utils::read_file(paths_.version_file);
    if (!text) {
        COMPONENT_LOG_DEBUG("Cannot read {}: {}", paths_.version_file.string(), text.error().message());
        return "unknown";
    }
    const std::string version = trim(text.value());
    return version.empty() ? "unknown" : "V" + version;
}

}  // namespace scoreboard::controlhub
