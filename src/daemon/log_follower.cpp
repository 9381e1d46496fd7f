#include "daemon/log_follower.hpp"

#include <QFileInfo>
#include <QTimer>

#include <sys/stat.h>

#include "common/logging.hpp"

namespace apwatch {

namespace {

constexpr qint64 kReadChunkBytes = 16 * 1024;
// Bounds one poll() so a large backlog does not starve the thread's event loop.
constexpr int kMaxLinesPerPoll = 5000;

} // namespace

LogFollower::LogFollower(QObject *parent)
    : QObject(parent)
{
}

LogFollower::~LogFollower() = default;

void LogFollower::setPath(const QString &path)
{
    m_file.close();
    m_path = path;
    m_inode = 0;
    m_device = 0;
    m_offset = 0;
    m_pending.clear();
    m_error.clear();
    m_failed = false;
}

QString LogFollower::path() const
{
    return m_path;
}

QString LogFollower::errorString() const
{
    return m_error;
}

LogFollower::ReadStatus LogFollower::readLine(QString *line)
{
    if (m_failed) {
        return ReadStatus::Fatal;
    }
    if (m_path.isEmpty()) {
        fail(QStringLiteral("no file registered to follow"));
        return ReadStatus::Fatal;
    }

    for (;;) {
        const int newline = m_pending.indexOf('\n');
        if (newline >= 0) {
            QByteArray raw = m_pending.left(newline);
            m_pending.remove(0, newline + 1);
            if (raw.endsWith('\r')) {
                raw.chop(1);
            }
            if (raw.trimmed().isEmpty()) {
                continue;
            }
            *line = QString::fromUtf8(raw);
            return ReadStatus::Line;
        }

        if (!m_file.isOpen()) {
            if (!QFileInfo::exists(m_path)) {
                return ReadStatus::NoLine;
            }
            if (!openCurrentFile()) {
                return ReadStatus::Fatal;
            }
        }

        bool gotData = false;
        if (!refillBuffer(&gotData)) {
            return ReadStatus::Fatal;
        }
        if (gotData) {
            continue;
        }

        // The old file is drained; switch to its replacement if rotated.
        if (currentFileReplaced()) {
            APWLOG_INFO(QStringLiteral("LogFollower"),
                        QStringLiteral("readLine"),
                        QStringLiteral("log_rotated"),
                        QStringLiteral("inode_changed"),
                        QStringLiteral("reopen_from_start"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"path", m_path.toStdString()},
                                        {"bytesRead", m_offset}}));
            if (!m_pending.isEmpty()) {
                // Deliver an unterminated final line of the rotated file.
                m_pending.append('\n');
            }
            m_file.close();
            continue;
        }
        return ReadStatus::NoLine;
    }
}

bool LogFollower::openCurrentFile()
{
    m_file.setFileName(m_path);
    if (!m_file.open(QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        fail(QStringLiteral("cannot open %1: %2").arg(m_path, m_file.errorString()));
        return false;
    }

    struct stat info {};
    if (fstat(m_file.handle(), &info) == 0) {
        m_inode = static_cast<quint64>(info.st_ino);
        m_device = static_cast<quint64>(info.st_dev);
    }
    m_offset = 0;

    APWLOG_INFO(QStringLiteral("LogFollower"),
                QStringLiteral("openCurrentFile"),
                QStringLiteral("log_opened"),
                QStringLiteral("follow_file"),
                QStringLiteral("read_from_start"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"path", m_path.toStdString()}}));
    return true;
}

bool LogFollower::refillBuffer(bool *gotData)
{
    *gotData = false;

    if (m_file.size() < m_offset) {
        // Truncated in place (copytruncate rotation).
        if (!m_file.seek(0)) {
            fail(QStringLiteral("cannot rewind %1: %2").arg(m_path, m_file.errorString()));
            return false;
        }
        APWLOG_INFO(QStringLiteral("LogFollower"),
                    QStringLiteral("refillBuffer"),
                    QStringLiteral("log_truncated"),
                    QStringLiteral("size_below_offset"),
                    QStringLiteral("reopen_from_start"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", m_path.toStdString()},
                                    {"bytesRead", m_offset}}));
        m_offset = 0;
        m_pending.clear();
    }

    char buffer[kReadChunkBytes];
    const qint64 count = m_file.read(buffer, kReadChunkBytes);
    if (count < 0) {
        fail(QStringLiteral("read failed on %1: %2").arg(m_path, m_file.errorString()));
        return false;
    }
    if (count == 0) {
        return true;
    }

    m_pending.append(buffer, static_cast<int>(count));
    m_offset += count;
    *gotData = true;
    return true;
}

bool LogFollower::currentFileReplaced() const
{
    struct stat info {};
    if (stat(QFile::encodeName(m_path).constData(), &info) != 0) {
        // Renamed away with no successor yet; keep reading the old one.
        return false;
    }
    return static_cast<quint64>(info.st_ino) != m_inode
        || static_cast<quint64>(info.st_dev) != m_device;
}

void LogFollower::fail(const QString &message)
{
    m_failed = true;
    m_error = message;
    m_file.close();
}

void LogFollower::start(int intervalMs)
{
    if (!m_timer) {
        m_timer = new QTimer(this);
        connect(m_timer, &QTimer::timeout, this, &LogFollower::poll);
    }
    m_timer->setInterval(intervalMs);
    m_timer->start();

    poll();
}

void LogFollower::stop()
{
    if (m_timer) {
        m_timer->stop();
    }
}

void LogFollower::poll()
{
    QString line;
    for (int count = 0; count < kMaxLinesPerPoll; ++count) {
        switch (readLine(&line)) {
        case ReadStatus::Line:
            emit lineRead(line);
            break;
        case ReadStatus::NoLine:
            return;
        case ReadStatus::Fatal:
            stop();
            emit fatalError(m_error);
            return;
        }
    }

    // Backlog remains; continue after pending events are processed.
    if (m_timer && m_timer->isActive()) {
        QTimer::singleShot(0, this, &LogFollower::poll);
    }
}

} // namespace apwatch
