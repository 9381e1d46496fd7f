#pragma once

#include <QByteArray>
#include <QFile>
#include <QObject>
#include <QString>

class QTimer;

namespace apwatch {

/**
 * LogFollower tails one growing text file from its beginning, like `tail -F`:
 * - a file that does not exist yet is waited for;
 * - a partially written last line is held back until its newline arrives;
 * - rotation (path now names a different file) and truncation restart
 *   reading from the start of the current file.
 *
 * readLine() can be called directly; start() drives it from a QTimer and
 * reports through signals.
 */
class LogFollower : public QObject
{
    Q_OBJECT
public:
    enum class ReadStatus {
        Line,
        // Nothing complete yet; try again later.
        NoLine,
        // Unrecoverable. errorString() describes it.
        Fatal
    };

    explicit LogFollower(QObject *parent = nullptr);
    ~LogFollower() override;

    void setPath(const QString &path);
    QString path() const;

    ReadStatus readLine(QString *line);
    QString errorString() const;

public slots:
    void start(int intervalMs);
    void stop();
    // Drain every complete line currently available.
    void poll();

signals:
    void lineRead(const QString &line);
    void fatalError(const QString &message);

private:
    bool openCurrentFile();
    bool refillBuffer(bool *gotData);
    bool currentFileReplaced() const;
    void fail(const QString &message);

    QString m_path;
    QFile m_file;
    quint64 m_inode = 0;
    quint64 m_device = 0;
    qint64 m_offset = 0;
    QByteArray m_pending;
    QString m_error;
    bool m_failed = false;
    QTimer *m_timer = nullptr;
};

} // namespace apwatch
