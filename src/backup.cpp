#include "backup.hpp"
#include "backup_api.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <utility>

namespace fs = std::filesystem;

namespace {

// Releases the in-flight flag when a run ends, however it ends.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

const char* triggerName(Backup::Trigger trigger) {
    return trigger == Backup::Trigger::Manual ? "manual" : "scheduled";
}

} // namespace

Backup::Backup(const std::string& configFile) : Backup(BackupConfig(configFile)) {}

Backup::Backup(BackupConfig config,
               std::unique_ptr<FileBackupStrategy> fileStrategy,
               std::unique_ptr<NotificationStrategy> notificationStrategy,
               Clock clock,
               RetentionManager::Remover remover)
    : config(std::move(config)),
      fileStrategy(std::move(fileStrategy)),
      notificationStrategy(std::move(notificationStrategy)),
      retention(this->config, std::move(remover)),
      clock(std::move(clock)) {
    if (!this->fileStrategy) {
        this->fileStrategy = std::make_unique<ZipFileBackupStrategy>(this->config);
    }
    if (!this->notificationStrategy && !this->config.telegramConfig.empty()) {
        this->notificationStrategy = std::make_unique<TelegramNotificationStrategy>(this->config.telegramConfig);
    }
    if (!this->clock) {
        this->clock = [] { return std::chrono::system_clock::now(); };
    }
}

Backup::~Backup() {
    stop();
}

ArchiveTask Backup::makeTask() const {
    ArchiveTask task;
    task.sourceRoot = fs::absolute(config.sourcePath).lexically_normal().string();
    task.destinationDir = config.getBackupDir();
    task.rules = config.getExclusionRules();
    task.archiveName = makeArchiveName(clock());
    return task;
}

Backup::Outcome Backup::runBackup(const ArchiveTask& task) {
    return execute(task, Trigger::Manual);
}

Backup::Outcome Backup::runBackup() {
    return runBackup(makeTask());
}

Backup::Outcome Backup::triggerManual(bool isAdministrator) {
    if (!isAdministrator) {
        std::string errorMsg = "Manual backup refused: caller is not an administrator";
        config.logWarning(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::PermissionDenied, errorMsg});
    }
    return runBackup();
}

Backup::Outcome Backup::execute(const ArchiveTask& task, Trigger trigger) {
    TimePoint requestedAt = clock();
    bool idle = false;
    if (!inFlight.compare_exchange_strong(idle, true)) {
        std::string errorMsg = std::format("Rejected {} backup: another backup is in progress for {}",
                                           triggerName(trigger), task.destinationDir);
        config.logWarning(errorMsg);
        return std::unexpected(BackupError{BackupErrorKind::Busy, errorMsg});
    }
    InFlightGuard guard(inFlight);

    config.logMessage(std::format("Starting {} backup: {}", triggerName(trigger), task.archiveName));

    Outcome outcome = [&]() -> Outcome {
        auto archive = fileStrategy->execute(task);
        if (!archive) {
            config.logError(std::format("Backup failed [{}]: {}", toString(archive.error().kind), archive.error().message));
            return std::unexpected(archive.error());
        }

        BackupReport report;
        report.archive = *archive;
        auto cleanup = retention.enforce(task.destinationDir, config.maxBackups);
        if (!cleanup) {
            std::string warning = std::format("Cleanup failed: {}", cleanup.error().message);
            config.logWarning(warning);
            report.warnings.push_back(warning);
        } else {
            report.retention = *cleanup;
            for (const auto& failure : report.retention.failures) {
                report.warnings.push_back(failure.error.message);
            }
        }

        config.logMessage(std::format("Backup completed: {}, size: {}, removed {} old backup(s)",
                                      report.archive.archivePath, BackupAPI::formatSize(report.archive.sizeBytes),
                                      report.retention.deleted.size()));
        return report;
    }();

    {
        std::lock_guard<std::mutex> lock(lastRunMutex);
        lastRunRecord = RunRecord{trigger, requestedAt, outcome};
    }
    return outcome;
}

std::expected<std::vector<BackupFileRecord>, BackupError> Backup::status() const {
    auto records = retention.listBackups(config.getBackupDir());
    if (!records) {
        return std::unexpected(records.error());
    }
    std::reverse(records->begin(), records->end());
    return records;
}

std::expected<void, BackupError> Backup::start() {
    std::lock_guard<std::mutex> lock(schedulerMutex);
    if (schedulerThread.joinable()) {
        return {};
    }

    auto schedule = CronSchedule::parse(config.cronExpression);
    if (!schedule) {
        config.logError(std::format("Scheduler not started: {}", schedule.error().message));
        return std::unexpected(schedule.error());
    }

    ScheduleState state(*schedule, clock());
    if (!state.nextTrigger()) {
        std::string errorMsg = std::format("Cron expression '{}' never matches a calendar date", config.cronExpression);
        config.logError(std::format("Scheduler not started: {}", errorMsg));
        return std::unexpected(BackupError{BackupErrorKind::InvalidExpression, errorMsg});
    }

    scheduleState = std::move(state);
    stopRequested = false;
    config.logMessage(std::format("Scheduled backup started, cron expression: {}", config.cronExpression));
    config.logMessage(
        std::format("Next backup at {}", formatLocalTime(*scheduleState->nextTrigger(), "%Y-%m-%d %H:%M:%S")));
    schedulerThread = std::thread(&Backup::schedulerLoop, this);
    return {};
}

void Backup::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(schedulerMutex);
        if (!schedulerThread.joinable()) {
            return;
        }
        stopRequested = true;
        worker = std::move(schedulerThread);
    }
    schedulerCv.notify_all();
    worker.join();

    std::lock_guard<std::mutex> lock(schedulerMutex);
    scheduleState.reset();
    config.logMessage("Scheduled backup stopped");
}

bool Backup::isSchedulerRunning() const {
    std::lock_guard<std::mutex> lock(schedulerMutex);
    return schedulerThread.joinable();
}

std::optional<Backup::TimePoint> Backup::nextScheduledRun() const {
    std::lock_guard<std::mutex> lock(schedulerMutex);
    if (!scheduleState) {
        return std::nullopt;
    }
    return scheduleState->nextTrigger();
}

std::optional<Backup::RunRecord> Backup::lastRun() const {
    std::lock_guard<std::mutex> lock(lastRunMutex);
    return lastRunRecord;
}

void Backup::schedulerLoop() {
    std::unique_lock<std::mutex> lock(schedulerMutex);
    while (!stopRequested) {
        schedulerCv.wait_for(lock, config.checkInterval, [this] { return stopRequested; });
        if (stopRequested) {
            break;
        }
        if (!scheduleState->poll(clock())) {
            continue;
        }
        auto next = scheduleState->nextTrigger();

        lock.unlock();
        config.logMessage("Running scheduled backup...");
        auto outcome = execute(makeTask(), Trigger::Scheduled);
        if (outcome) {
            config.logMessage(std::format("Scheduled backup succeeded: {}", outcome->archive.fileName));
        } else if (outcome.error().kind == BackupErrorKind::Busy) {
            config.logWarning(std::format("Scheduled backup skipped: {}", outcome.error().message));
        } else {
            config.logError(std::format("Scheduled backup failed: {}", outcome.error().message));
        }
        notify(std::format("Scheduled backup: {}", BackupAPI::formatOutcome(outcome)));
        if (next) {
            config.logMessage(std::format("Next backup at {}", formatLocalTime(*next, "%Y-%m-%d %H:%M:%S")));
        } else {
            config.logWarning(std::format("Cron expression '{}' has no further trigger", config.cronExpression));
        }
        lock.lock();
    }
}

void Backup::notify(const std::string& message) {
    if (!notificationStrategy) {
        return;
    }
    auto result = notificationStrategy->notify(message);
    if (!result) {
        config.logWarning(std::format("Notification failed: {}", result.error()));
    }
}
