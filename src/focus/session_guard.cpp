#include "focus/session_guard.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>

#include "common/logging.hpp"

namespace tracewatch {

LockFileSessionGuard::LockFileSessionGuard(const QString &lockPath,
                                           std::chrono::milliseconds staleAfter)
    : m_path(lockPath)
    , m_staleAfter(staleAfter)
    , m_lock(std::make_unique<QLockFile>(lockPath))
{
    m_lock->setStaleLockTime(static_cast<int>(staleAfter.count()));
}

LockFileSessionGuard::~LockFileSessionGuard()
{
    release();
}

QString LockFileSessionGuard::defaultLockPath()
{
    return QDir::homePath() + QStringLiteral("/.local/share/tracewatch/focus.lock");
}

bool LockFileSessionGuard::tryAcquire()
{
    if (m_lock->isLocked()) {
        return true;
    }

    QDir().mkpath(QFileInfo(m_path).absolutePath());
    bool acquired = m_lock->tryLock(0);

    // QLockFile never breaks a lock whose owner is still running, however old.
    if (!acquired && m_lock->error() == QLockFile::LockFailedError) {
        const qint64 ageMs =
            QFileInfo(m_path).lastModified().msecsTo(QDateTime::currentDateTime());
        if (ageMs > m_staleAfter.count()) {
            TWLOG_WARN(QStringLiteral("LockFileSessionGuard"),
                       QStringLiteral("tryAcquire"),
                       QStringLiteral("stale_lock_reclaimed"),
                       QStringLiteral("older_than_stale_timeout"),
                       QStringLiteral("remove_lock_file"),
                       ::tracewatch::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", m_path.toStdString()},
                                       {"holderPid", holderPid()},
                                       {"ageMs", ageMs}}));
            acquired = QFile::remove(m_path) && m_lock->tryLock(0);
        }
    }

    if (acquired) {
        TWLOG_INFO(QStringLiteral("LockFileSessionGuard"),
                   QStringLiteral("tryAcquire"),
                   QStringLiteral("lock_acquired"),
                   QStringLiteral("session_start"),
                   QStringLiteral("lock_file"),
                   ::tracewatch::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path.toStdString()}}));
        return true;
    }

    TWLOG_WARN(QStringLiteral("LockFileSessionGuard"),
               QStringLiteral("tryAcquire"),
               QStringLiteral("lock_conflict"),
               m_lock->error() == QLockFile::LockFailedError
                   ? QStringLiteral("held_by_other_run")
                   : QStringLiteral("lock_file_error"),
               QStringLiteral("lock_file"),
               ::tracewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_path.toStdString()}, {"holderPid", holderPid()}}));
    return false;
}

void LockFileSessionGuard::release()
{
    if (m_lock && m_lock->isLocked()) {
        m_lock->unlock();
    }
}

bool LockFileSessionGuard::isHeld() const
{
    return m_lock->isLocked();
}

QString LockFileSessionGuard::lockPath() const
{
    return m_path;
}

qint64 LockFileSessionGuard::holderPid() const
{
    qint64 pid = 0;
    QString hostname;
    QString appname;
    if (!m_lock->getLockInfo(&pid, &hostname, &appname)) {
        return 0;
    }
    return pid;
}

std::shared_ptr<InMemorySessionGuard::Slot> InMemorySessionGuard::makeSlot()
{
    return std::make_shared<Slot>();
}

InMemorySessionGuard::InMemorySessionGuard(std::shared_ptr<Slot> slot,
                                           std::chrono::milliseconds staleAfter)
    : m_slot(std::move(slot))
    , m_staleAfter(staleAfter)
{
}

InMemorySessionGuard::~InMemorySessionGuard()
{
    release();
}

bool InMemorySessionGuard::tryAcquire()
{
    std::lock_guard<std::mutex> lock(m_slot->mutex);
    const auto now = Clock::now();
    if (m_slot->held) {
        if (m_ownGeneration == m_slot->generation) {
            return true;
        }
        if (now - m_slot->acquiredAt <= m_staleAfter) {
            return false;
        }
    }
    m_slot->held = true;
    m_slot->acquiredAt = now;
    m_ownGeneration = ++m_slot->generation;
    return true;
}

void InMemorySessionGuard::release()
{
    std::lock_guard<std::mutex> lock(m_slot->mutex);
    if (m_slot->held && m_ownGeneration == m_slot->generation) {
        m_slot->held = false;
    }
    m_ownGeneration = 0;
}

bool InMemorySessionGuard::isHeld() const
{
    std::lock_guard<std::mutex> lock(m_slot->mutex);
    return m_slot->held && m_ownGeneration == m_slot->generation;
}

} // namespace tracewatch
