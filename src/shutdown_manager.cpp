#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

namespace
{
    constexpr auto WATCH_INTERVAL = std::chrono::milliseconds(50);
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);

    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        if (sigaction(sig, &action, nullptr) != 0)
        {
            Logger::error("Failed to install handler for signal " + std::to_string(sig) + ": " + std::strerror(errno));
        }
    }

    // A peer closing an HTTPS connection mid-write must not terminate the process
    signal(SIGPIPE, SIG_IGN);

    startWatcher();
    Logger::debug("Signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("signal received", sig);
                break;
            }
            std::this_thread::sleep_for(WATCH_INTERVAL);
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
            return;
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
        Logger::info("Received signal " + std::to_string(signal_number) + ", shutting down");
    else
        Logger::info("Shutdown requested: " + reason);
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;
    reason_.clear();
}
