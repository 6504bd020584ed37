#include "log_manager.h"
#include <QDebug>
#include <QMutexLocker>
#include <QFileInfo>
#include <QDir>
#include <cstdio>
#include <cstdlib>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_sinceFlush.start();
}

LogManager::~LogManager() {
    flush();
}

void LogManager::install() {
    instance();
    qInstallMessageHandler(customMessageHandler);
}

bool LogManager::setLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen()) {
        flushLocked();
        m_ts.setDevice(nullptr);
        m_file.close();
    }
    if (path.isEmpty()) return true;

    QDir().mkpath(QFileInfo(path).absolutePath());
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        // Not through qWarning: the handler would re-enter this mutex.
        fprintf(stderr, "LogManager: cannot open log file %s\n", path.toLocal8Bit().constData());
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    m_sinceFlush.restart();
    return true;
}

QString LogManager::logFile() const {
    QMutexLocker locker(&m_mutex);
    return m_file.isOpen() ? m_file.fileName() : QString();
}

int LogManager::levelRank(const QString& level) {
    const QString upper = level.toUpper();
    if (upper == "DEBUG") return 0;
    if (upper == "INFO") return 1;
    if (upper == "WARN" || upper == "WARNING") return 2;
    if (upper == "ERROR") return 3;
    if (upper == "FATAL") return 4;
    return -1;
}

void LogManager::setMinimumLevel(const QString& level) {
    const int rank = levelRank(level);
    QMutexLocker locker(&m_mutex);
    m_minRank = (rank < 0 || rank > 3) ? 1 : rank;
}

QString LogManager::minimumLevel() const {
    static const char* const names[] = { "DEBUG", "INFO", "WARN", "ERROR" };
    QMutexLocker locker(&m_mutex);
    return QString::fromLatin1(names[m_minRank]);
}

bool LogManager::accepts(const QString& level) const {
    QMutexLocker locker(&m_mutex);
    return levelRank(level) >= m_minRank;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        if (levelRank(level) < m_minRank) return;

        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk log with buffered flushing
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            m_pendingFlush = true;
            if (shouldFlushImmediately(level) || m_sinceFlush.elapsed() >= FLUSH_INTERVAL_MS) {
                flushLocked();
            }
        }
    }

    emit logAdded(logEntry);
}

void LogManager::flush() {
    QMutexLocker locker(&m_mutex);
    flushLocked();
}

void LogManager::flushLocked() {
    if (m_ts.device() && m_pendingFlush) {
        m_ts.flush();
    }
    m_pendingFlush = false;
    m_sinceFlush.restart();
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    LogManager& lm = LogManager::instance();
    if (lm.accepts(level)) {
        lm.addLog(msg, level);

        // Also output to stderr for debugging
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        fprintf(stderr, "[%s] [%s] %s\n",
                timestamp.toLocal8Bit().constData(),
                level.toLocal8Bit().constData(),
                msg.toLocal8Bit().constData());
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        lm.flush();
        abort();
    }
}
