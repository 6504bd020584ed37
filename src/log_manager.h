#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QTextStream>

// Process-wide sink for every qDebug/qInfo/qWarning/qCritical message.
// Safe to call from any thread; file writes happen under the mutex.
class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Routes Qt messages here. Call once, early in main().
    static void install();

    // Opens (append) the write-through file; an empty path disables it.
    bool setLogFile(const QString& path);
    QString logFile() const;

    // DEBUG, INFO, WARN or ERROR. Unknown names fall back to INFO.
    void setMinimumLevel(const QString& level);
    QString minimumLevel() const;
    bool accepts(const QString& level) const;

    QStringList logs() const;

    void addLog(const QString& message, const QString& level = "INFO");
    void flush();
    void clear();

    static int levelRank(const QString& level);

signals:
    void logAdded(const QString& entry);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushLocked();
    bool shouldFlushImmediately(const QString& level) const;

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QElapsedTimer m_sinceFlush;
    bool m_pendingFlush = false;
    int m_minRank = 1;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
