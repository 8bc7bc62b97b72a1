#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Libs
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// parts
#include "config.hpp"
#include "duration.hpp"
#include "lifeblocks.hpp"
#include "openrouter.hpp"
#include "scheduler.hpp"
#include "secrets.hpp"
#include "todoist.hpp"

#include "common.hpp"

// Long-running process: one scheduling pass every few minutes, plus a local control API.
class Retimer {
  public:
    Retimer(Config config, LogLevel log_level);
    ~Retimer();

    void RunForever();
    void RequestShutdown();

    // Runs one pass unless one is already in flight. Returns false when skipped.
    bool RunPassIfIdle();
    nlohmann::json Status();

  private:
    bool InitServer();
    void WakeScheduler();
    void WaitUntilNextDeadline();
    LifeBlocks SnapshotLifeBlocks();

  private:
    Config m_Config;

    // Parts
    std::unique_ptr<Secrets> m_Secrets;
    std::unique_ptr<TodoistClient> m_Todoist;
    std::unique_ptr<OpenRouter> m_OpenRouter;
    std::unique_ptr<DurationEstimator> m_Estimator;

    // Life blocks are edited from the server thread
    std::mutex m_BlocksMutex;
    LifeBlocks m_LifeBlocks;

    // One pass at a time
    std::mutex m_PassMutex;
    std::atomic<bool> m_PassRunning{false};

    std::mutex m_StatusMutex;
    nlohmann::json m_LastReport;
    std::string m_LastError;
    std::string m_LastPassAt;

    // Scheduler: wait-until-next-deadline with reliable wakeups
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};
    std::atomic<bool> m_RunRequested{false};
    std::chrono::steady_clock::time_point m_NextPassAt{};

    static constexpr std::chrono::seconds kShutdownPollEvery{1};

    // Server
    std::thread m_Thread;
    httplib::Server m_Server;
};
