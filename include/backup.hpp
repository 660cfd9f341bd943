/**
 * @file backup.hpp
 * @brief Defines the backup orchestration class for autobackup.
 *
 * A Backup composes the archive strategy, the retention manager and the cron schedule
 * into one "run a backup" operation shared by manual and scheduled triggers. It owns
 * the in-flight guard that rejects overlapping runs, the scheduler thread with its
 * explicit start/stop lifecycle, and the record of the last run.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "cron_schedule.hpp"
#include "file_backup.hpp"
#include "notification.hpp"
#include "retention.hpp"

/**
 * @brief Outcome of a successful backup run.
 */
struct BackupReport {
    ArchiveResult archive;             ///< The archive that was written.
    RetentionReport retention;         ///< What the retention pass removed or failed to remove.
    std::vector<std::string> warnings; ///< Cleanup problems that did not fail the run.
};

/**
 * @brief Main backup orchestration class.
 */
class Backup {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;
    using Outcome = std::expected<BackupReport, BackupError>;

    /**
     * @brief What started a run.
     */
    enum class Trigger {
        Manual,
        Scheduled
    };

    /**
     * @brief Record of the most recent run, the result channel for scheduled backups.
     */
    struct RunRecord {
        Trigger trigger;     ///< Manual or scheduled.
        TimePoint startedAt; ///< Clock time when the run was requested.
        Outcome outcome;     ///< Report or failure.
    };

    /**
     * @brief Constructs a backup instance from a configuration file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If configuration is invalid.
     */
    explicit Backup(const std::string& configFile);

    /**
     * @brief Constructs a backup instance with explicit collaborators.
     *
     * @param config Backup configuration.
     * @param fileStrategy Archive strategy; defaults to ZipFileBackupStrategy.
     * @param notificationStrategy Result notifier; defaults to Telegram when configured.
     * @param clock Wall clock used for archive names and schedule evaluation.
     * @param remover Deletion primitive for retention; defaults to std::filesystem::remove.
     */
    explicit Backup(BackupConfig config,
                    std::unique_ptr<FileBackupStrategy> fileStrategy = nullptr,
                    std::unique_ptr<NotificationStrategy> notificationStrategy = nullptr,
                    Clock clock = {},
                    RetentionManager::Remover remover = {});

    Backup(const Backup&) = delete;
    Backup& operator=(const Backup&) = delete;

    /**
     * @brief Stops the scheduler if it is running.
     */
    ~Backup();

    /**
     * @brief Describes a run of the configured source into the configured destination,
     * named after the current clock time.
     */
    ArchiveTask makeTask() const;

    /**
     * @brief Runs one backup: build the archive, then enforce retention.
     *
     * A failed archive build is returned untouched and skips retention. Retention
     * problems are logged and attached as warnings without failing the run.
     *
     * @param task Archive to build.
     * @return Outcome The report, or the archive failure, or Busy when another run is
     *         in flight.
     */
    Outcome runBackup(const ArchiveTask& task);

    /**
     * @brief Runs a backup described by makeTask().
     */
    Outcome runBackup();

    /**
     * @brief Runs an on-demand backup on behalf of a caller.
     *
     * @param isAdministrator Whether the caller may trigger backups.
     * @return Outcome PermissionDenied for non-administrators, otherwise as runBackup().
     */
    Outcome triggerManual(bool isAdministrator);

    /**
     * @brief Lists the current archives, newest first. Never modifies the directory.
     */
    std::expected<std::vector<BackupFileRecord>, BackupError> status() const;

    /**
     * @brief Validates the cron expression and starts the scheduler thread.
     *
     * Calling start() while the scheduler runs has no effect.
     *
     * @return std::expected<void, BackupError> Success or InvalidExpression.
     */
    std::expected<void, BackupError> start();

    /**
     * @brief Stops the scheduler thread. A run in progress completes first.
     */
    void stop();

    bool isSchedulerRunning() const;
    bool isBackupInProgress() const { return inFlight.load(); }

    /**
     * @brief Returns the next scheduled trigger, if the scheduler is running.
     */
    std::optional<TimePoint> nextScheduledRun() const;

    /**
     * @brief Returns the record of the last run that actually started.
     */
    std::optional<RunRecord> lastRun() const;

    const BackupConfig& getConfig() const { return config; }

private:
    Outcome execute(const ArchiveTask& task, Trigger trigger);
    void schedulerLoop();
    void notify(const std::string& message);

    BackupConfig config;                                         ///< Backup configuration.
    std::unique_ptr<FileBackupStrategy> fileStrategy;            ///< Archive strategy.
    std::unique_ptr<NotificationStrategy> notificationStrategy;  ///< Optional notifier.
    RetentionManager retention;                                  ///< Retention policy.
    Clock clock;                                                 ///< Wall clock.

    std::atomic<bool> inFlight{false};                           ///< In-flight guard.

    mutable std::mutex schedulerMutex;
    std::condition_variable schedulerCv;
    std::thread schedulerThread;
    bool stopRequested = false;
    std::optional<ScheduleState> scheduleState;

    mutable std::mutex lastRunMutex;
    std::optional<RunRecord> lastRunRecord;
};

#endif // BACKUP_HPP
