#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <QString>

class QLockFile;

namespace tracewatch {

// Thrown when a focus or pomodoro run is already active.
class SessionConflictError : public std::runtime_error
{
public:
    explicit SessionConflictError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Exclusive right to run a focus session. A holder that disappears without
// releasing leaves a stale claim which is reclaimed after the staleness
// timeout.
class SessionGuard
{
public:
    virtual ~SessionGuard() = default;

    virtual bool tryAcquire() = 0;
    virtual void release() = 0;
    virtual bool isHeld() const = 0;
};

/**
 * Lock file holding the owner's pid, host and application name. A lock
 * whose owner process is gone, or whose file is older than staleAfter, is
 * reclaimed. Reclaiming an aged lock ignores whether its owner still runs;
 * the previous owner's release() then deletes the new owner's file.
 */
class LockFileSessionGuard : public SessionGuard
{
public:
    explicit LockFileSessionGuard(const QString &lockPath,
                                  std::chrono::milliseconds staleAfter = std::chrono::hours(1));
    ~LockFileSessionGuard() override;

    // ~/.local/share/tracewatch/focus.lock
    static QString defaultLockPath();

    bool tryAcquire() override;
    void release() override;
    bool isHeld() const override;

    QString lockPath() const;
    // Pid recorded in the lock file by the current holder, 0 when unknown.
    qint64 holderPid() const;

private:
    QString m_path;
    std::chrono::milliseconds m_staleAfter;
    std::unique_ptr<QLockFile> m_lock;
};

// Process-local guard. Guards constructed over the same Slot exclude each
// other, which lets a long-running host and its tests share one claim.
class InMemorySessionGuard : public SessionGuard
{
public:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        std::mutex mutex;
        bool held = false;
        uint64_t generation = 0;
        Clock::time_point acquiredAt;
    };

    static std::shared_ptr<Slot> makeSlot();

    explicit InMemorySessionGuard(std::shared_ptr<Slot> slot,
                                  std::chrono::milliseconds staleAfter = std::chrono::hours(1));
    ~InMemorySessionGuard() override;

    bool tryAcquire() override;
    void release() override;
    bool isHeld() const override;

private:
    std::shared_ptr<Slot> m_slot;
    std::chrono::milliseconds m_staleAfter;
    uint64_t m_ownGeneration = 0;
};

} // namespace tracewatch
