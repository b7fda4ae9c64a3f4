#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <QDateTime>
#include <QFileSystemWatcher>
#include <QObject>
#include <QString>
#include <QThread>
#include <QTimer>

namespace taskheader {

// Runs sync requests on the watcher's worker thread, one at a time.
class MarkdownSyncWorker : public QObject
{
    Q_OBJECT
public:
    using SyncFunction = std::function<int(const QString &path)>;
    using SyncedCallback = std::function<void(int count)>;

    MarkdownSyncWorker(SyncFunction syncFunction, SyncedCallback onSynced);

    // Claims the single queue slot. Returns false when a run is already
    // queued; that run reads the file when it starts, so it covers this edit.
    bool tryQueue();

public slots:
    void process(const QString &path);

signals:
    void synced(int count);
    void syncFailed(const QString &message);

private:
    SyncFunction m_syncFunction;
    SyncedCallback m_onSynced;
    std::atomic<bool> m_queued{false};
};

/**
 * MarkdownWatcher observes one markdown file and triggers a sync whenever it
 * is written.
 *
 * The parent directory is watched (non-recursively) together with the file
 * itself, so both in-place writes and editors that replace the file are
 * seen. Events are debounced on the owning thread and handed to a single
 * worker thread; the optional callback runs on that worker thread, while the
 * synced() signal is delivered on the watcher's own thread.
 */
class MarkdownWatcher : public QObject
{
    Q_OBJECT
public:
    explicit MarkdownWatcher(MarkdownSyncWorker::SyncFunction syncFunction,
                             QObject *parent = nullptr);
    ~MarkdownWatcher() override;

    // Replaces any previous watch. Returns false when the parent directory
    // cannot be observed.
    bool watch(const QString &path, MarkdownSyncWorker::SyncedCallback onSynced = {});
    // Safe to call when not watching. Blocks until an in-flight sync returns.
    void unwatch();

    bool isWatching() const;
    QString targetPath() const;

    void setDebounceInterval(int ms);

signals:
    void synced(int count);
    void syncFailed(const QString &message);

private slots:
    void onDirectoryChanged(const QString &path);
    void onFileChanged(const QString &path);
    void dispatchSync();

private:
    struct FileStamp {
        bool exists = false;
        qint64 size = -1;
        QDateTime modified;

        bool operator==(const FileStamp &other) const
        {
            return exists == other.exists && size == other.size
                && modified == other.modified;
        }
    };

    FileStamp currentStamp() const;
    void ensureFileWatched();

    MarkdownSyncWorker::SyncFunction m_syncFunction;
    QString m_targetPath;
    QString m_directoryPath;
    FileStamp m_lastStamp;

    std::unique_ptr<QFileSystemWatcher> m_fsWatcher;
    std::unique_ptr<QThread> m_workerThread;
    // Owned by m_workerThread; deleted via deleteLater when it finishes.
    MarkdownSyncWorker *m_worker = nullptr;
    QTimer m_debounce;
};

} // namespace taskheader
