#include "retimer.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <utility>

namespace {
std::atomic<bool> g_StopSignal{false};

void OnSignal(int) {
    g_StopSignal.store(true);
}
} // namespace

// ─────────────────────────────────────
Retimer::Retimer(Config config, LogLevel log_level) : m_Config(std::move(config)) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    spdlog::info("Data directory: {}", m_Config.data_dir.string());
    spdlog::info("Pass every {} minutes", m_Config.daemon.pass_interval_minutes);

    // Secrets
    m_Secrets = std::make_unique<Secrets>();
    spdlog::info("Secrets manager initialized");

    // Todoist
    m_Todoist = std::make_unique<TodoistClient>(
        m_Secrets->LoadSecretOrEnv("todoist_api_key", "TODOIST_KEY"));
    spdlog::info("Todoist client initialized");

    // OpenRouter (optional)
    const char *proxy = std::getenv("OPENROUTER_PROXY");
    m_OpenRouter = std::make_unique<OpenRouter>(
        m_Secrets->LoadSecretOrEnv("openrouter_key", "OPENROUTER_KEY"),
        proxy && *proxy ? proxy : OPENROUTER_DEFAULT_URL);
    if (m_OpenRouter->IsConfigured()) {
        spdlog::info("OpenRouter estimates enabled");
    } else {
        spdlog::warn("No OpenRouter key; durations come from markers and keywords only");
    }

    m_Estimator = std::make_unique<DurationEstimator>(m_Config.scheduler, m_OpenRouter.get());
    m_LifeBlocks = LifeBlocks::Load(m_Config.life_blocks_path);

    if (!InitServer()) {
        spdlog::warn("Control server not available on port {}", m_Config.daemon.port);
    }
}

// ─────────────────────────────────────
Retimer::~Retimer() {
    RequestShutdown();
    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
void Retimer::RequestShutdown() {
    m_ShutdownRequested.store(true);
    WakeScheduler();
}

// ─────────────────────────────────────
void Retimer::WakeScheduler() {
    m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    m_SchedulerCv.notify_one();
}

// ─────────────────────────────────────
LifeBlocks Retimer::SnapshotLifeBlocks() {
    std::lock_guard<std::mutex> lock(m_BlocksMutex);
    return m_LifeBlocks;
}

// ─────────────────────────────────────
bool Retimer::RunPassIfIdle() {
    std::unique_lock<std::mutex> pass(m_PassMutex, std::try_to_lock);
    if (!pass.owns_lock()) {
        spdlog::info("A pass is already running, skipping this trigger");
        return false;
    }

    m_PassRunning.store(true);
    const LifeBlocks blocks = SnapshotLifeBlocks();
    SlotScheduler scheduler(*m_Todoist, *m_Estimator, m_OpenRouter.get(), blocks,
                            m_Config.scheduler);

    nlohmann::json report;
    std::string error;
    try {
        report = scheduler.Run().ToJson();
    } catch (const UnschedulableError &e) {
        report = e.Report().ToJson();
        error = std::string("unschedulable: ") + e.what();
        spdlog::error("Pass aborted, task {} cannot be placed: {}", e.TaskId(), e.what());
    } catch (const std::exception &e) {
        error = e.what();
        spdlog::error("Pass failed: {}", e.what());
    }

    m_PassRunning.store(false);

    std::lock_guard<std::mutex> lock(m_StatusMutex);
    if (!report.is_null()) {
        m_LastReport = report;
    }
    m_LastError = error;
    m_LastPassAt = FormatDatetime(std::chrono::floor<std::chrono::minutes>(NowLocal()));
    return true;
}

// ─────────────────────────────────────
nlohmann::json Retimer::Status() {
    std::lock_guard<std::mutex> lock(m_StatusMutex);
    return nlohmann::json{
        {"last_pass_at", m_LastPassAt},
        {"last_error", m_LastError},
        {"last_report", m_LastReport},
    };
}

// ─────────────────────────────────────
void Retimer::RunForever() {
    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    while (!m_ShutdownRequested.load()) {
        const auto now = std::chrono::steady_clock::now();
        const bool requested = m_RunRequested.exchange(false);
        if (requested || now >= m_NextPassAt) {
            RunPassIfIdle();
            m_NextPassAt = std::chrono::steady_clock::now() +
                           std::chrono::minutes(m_Config.daemon.pass_interval_minutes);
        }

        WaitUntilNextDeadline();
        if (g_StopSignal.load()) {
            spdlog::info("Shutdown requested");
            RequestShutdown();
        }
    }
}

// ─────────────────────────────────────
void Retimer::WaitUntilNextDeadline() {
    // Signals cannot notify the condition variable, so wake up regularly to look for them.
    const auto deadline =
        std::min(m_NextPassAt, std::chrono::steady_clock::now() + kShutdownPollEvery);

    const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
    std::unique_lock<std::mutex> lk(m_SchedulerMutex);
    m_SchedulerCv.wait_until(lk, deadline, [&] {
        if (m_ShutdownRequested.load()) {
            return true;
        }
        return m_RunRequested.load() || m_WakeupSeq.load(std::memory_order_relaxed) != seq;
    });
}

// ─────────────────────────────────────
bool Retimer::InitServer() {
    m_Server.Get("/status", [this](const httplib::Request &, httplib::Response &res) {
        spdlog::debug("[GET] /status");
        res.status = 200;
        res.set_content(Status().dump(), "application/json");
    });

    m_Server.Post("/run", [this](const httplib::Request &, httplib::Response &res) {
        spdlog::info("[POST] /run");
        if (m_PassRunning.load()) {
            res.status = 409;
            res.set_content("pass already running", "text/plain");
            return;
        }
        m_RunRequested.store(true);
        WakeScheduler();
        res.status = 202;
        res.set_content("scheduled", "text/plain");
    });

    m_Server.Get("/blocks", [this](const httplib::Request &, httplib::Response &res) {
        spdlog::debug("[GET] /blocks");
        res.status = 200;
        res.set_content(SnapshotLifeBlocks().ToJson().dump(), "application/json");
    });

    m_Server.Post("/blocks", [this](const httplib::Request &req, httplib::Response &res) {
        spdlog::info("[POST] /blocks");
        try {
            LifeBlocks blocks = LifeBlocks::FromJson(nlohmann::json::parse(req.body));
            std::lock_guard<std::mutex> lock(m_BlocksMutex);
            blocks.Save(m_Config.life_blocks_path);
            m_LifeBlocks = std::move(blocks);
            res.status = 200;
            res.set_content(m_LifeBlocks.ToJson().dump(), "application/json");
        } catch (const nlohmann::json::exception &e) {
            res.status = 400;
            res.set_content(e.what(), "text/plain");
        } catch (const std::runtime_error &e) {
            res.status = 500;
            res.set_content(e.what(), "text/plain");
        }
    });

    if (!m_Server.bind_to_port("127.0.0.1", static_cast<int>(m_Config.daemon.port))) {
        return false;
    }
    spdlog::info("Serving on: http://localhost:{}", m_Config.daemon.port);
    m_Thread = std::thread([this]() { m_Server.listen_after_bind(); });
    return true;
}
