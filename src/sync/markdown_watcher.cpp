#include "sync/markdown_watcher.hpp"

#include <exception>
#include <utility>

#include <QDir>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace taskheader {

namespace {

constexpr int kDefaultDebounceMs = 250;

QString absoluteClean(const QString &path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

} // namespace

MarkdownSyncWorker::MarkdownSyncWorker(SyncFunction syncFunction, SyncedCallback onSynced)
    : m_syncFunction(std::move(syncFunction))
    , m_onSynced(std::move(onSynced))
{
}

bool MarkdownSyncWorker::tryQueue()
{
    return !m_queued.exchange(true);
}

void MarkdownSyncWorker::process(const QString &path)
{
    // Release the slot first: an edit landing while this run is in flight
    // must queue one more run.
    m_queued.store(false);

    logging::CorrelationScope scope(logging::newCorrelationId());
    try {
        const int count = m_syncFunction(path);
        THLOG_INFO(QStringLiteral("MarkdownWatcher"),
                   QStringLiteral("process"),
                   QStringLiteral("watch_sync_finished"),
                   QStringLiteral("file_modified"),
                   QStringLiteral("parse_reconcile"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path.toStdString()}, {"changed", count}});
        if (m_onSynced) {
            m_onSynced(count);
        }
        emit synced(count);
    } catch (const std::exception &ex) {
        THLOG_ERROR(QStringLiteral("MarkdownWatcher"),
                    QStringLiteral("process"),
                    QStringLiteral("watch_sync_failed"),
                    QStringLiteral("file_modified"),
                    QStringLiteral("keep_watching"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", path.toStdString()}, {"error", ex.what()}});
        emit syncFailed(QString::fromUtf8(ex.what()));
    }
}

MarkdownWatcher::MarkdownWatcher(MarkdownSyncWorker::SyncFunction syncFunction,
                                 QObject *parent)
    : QObject(parent)
    , m_syncFunction(std::move(syncFunction))
{
    m_debounce.setSingleShot(true);
    m_debounce.setInterval(kDefaultDebounceMs);
    connect(&m_debounce, &QTimer::timeout, this, &MarkdownWatcher::dispatchSync);
}

MarkdownWatcher::~MarkdownWatcher()
{
    unwatch();
}

bool MarkdownWatcher::watch(const QString &path,
                            MarkdownSyncWorker::SyncedCallback onSynced)
{
    unwatch();

    const QString target = absoluteClean(path);
    const QString directory = QFileInfo(target).absolutePath();

    auto fsWatcher = std::make_unique<QFileSystemWatcher>();
    if (!fsWatcher->addPath(directory)) {
        THLOG_WARN(QStringLiteral("MarkdownWatcher"),
                   QStringLiteral("watch"),
                   QStringLiteral("watch_failed"),
                   QStringLiteral("directory_unavailable"),
                   QStringLiteral("qfilesystemwatcher"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"directory", directory.toStdString()}});
        return false;
    }

    m_targetPath = target;
    m_directoryPath = directory;
    m_fsWatcher = std::move(fsWatcher);
    connect(m_fsWatcher.get(), &QFileSystemWatcher::directoryChanged,
            this, &MarkdownWatcher::onDirectoryChanged);
    connect(m_fsWatcher.get(), &QFileSystemWatcher::fileChanged,
            this, &MarkdownWatcher::onFileChanged);
    ensureFileWatched();
    m_lastStamp = currentStamp();

    m_workerThread = std::make_unique<QThread>();
    m_workerThread->setObjectName(QStringLiteral("markdown-sync"));
    m_worker = new MarkdownSyncWorker(m_syncFunction, std::move(onSynced));
    m_worker->moveToThread(m_workerThread.get());
    connect(m_workerThread.get(), &QThread::finished, m_worker, &QObject::deleteLater);
    connect(m_worker, &MarkdownSyncWorker::synced, this, &MarkdownWatcher::synced);
    connect(m_worker, &MarkdownSyncWorker::syncFailed, this, &MarkdownWatcher::syncFailed);
    m_workerThread->start();

    THLOG_INFO(QStringLiteral("MarkdownWatcher"),
               QStringLiteral("watch"),
               QStringLiteral("watch_started"),
               QStringLiteral("sync_on_edit"),
               QStringLiteral("qfilesystemwatcher"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", m_targetPath.toStdString()}});
    return true;
}

void MarkdownWatcher::unwatch()
{
    m_debounce.stop();

    if (m_fsWatcher) {
        disconnect(m_fsWatcher.get(), nullptr, this, nullptr);
        m_fsWatcher.reset();
    }

    if (m_workerThread) {
        m_workerThread->quit();
        m_workerThread->wait();
        m_workerThread.reset();
        m_worker = nullptr;

        THLOG_INFO(QStringLiteral("MarkdownWatcher"),
                   QStringLiteral("unwatch"),
                   QStringLiteral("watch_stopped"),
                   QStringLiteral("caller_request"),
                   QStringLiteral("thread_join"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", m_targetPath.toStdString()}});
    }

    m_targetPath.clear();
    m_directoryPath.clear();
    m_lastStamp = FileStamp{};
}

bool MarkdownWatcher::isWatching() const
{
    return m_fsWatcher != nullptr;
}

QString MarkdownWatcher::targetPath() const
{
    return m_targetPath;
}

void MarkdownWatcher::setDebounceInterval(int ms)
{
    m_debounce.setInterval(ms);
}

void MarkdownWatcher::onDirectoryChanged(const QString &path)
{
    Q_UNUSED(path)
    // Directory events do not name the file; compare the target's stamp to
    // tell our file apart from its neighbours.
    ensureFileWatched();
    const FileStamp stamp = currentStamp();
    if (stamp == m_lastStamp) {
        return;
    }
    m_lastStamp = stamp;
    if (stamp.exists) {
        m_debounce.start();
    }
}

void MarkdownWatcher::onFileChanged(const QString &path)
{
    if (absoluteClean(path) != m_targetPath) {
        return;
    }
    m_lastStamp = currentStamp();
    if (!m_lastStamp.exists) {
        // Replaced or deleted; the directory event for the new file follows.
        return;
    }
    ensureFileWatched();
    m_debounce.start();
}

void MarkdownWatcher::dispatchSync()
{
    if (!m_worker) {
        return;
    }
    if (!m_worker->tryQueue()) {
        THLOG_DEBUG(QStringLiteral("MarkdownWatcher"),
                    QStringLiteral("dispatchSync"),
                    QStringLiteral("sync_coalesced"),
                    QStringLiteral("run_already_queued"),
                    QStringLiteral("skip_enqueue"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"path", m_targetPath.toStdString()}});
        return;
    }

    MarkdownSyncWorker *worker = m_worker;
    const QString path = m_targetPath;
    QMetaObject::invokeMethod(worker, [worker, path]() { worker->process(path); },
                              Qt::QueuedConnection);
}

MarkdownWatcher::FileStamp MarkdownWatcher::currentStamp() const
{
    const QFileInfo info(m_targetPath);
    FileStamp stamp;
    stamp.exists = info.exists();
    if (stamp.exists) {
        stamp.size = info.size();
        stamp.modified = info.lastModified();
    }
    return stamp;
}

void MarkdownWatcher::ensureFileWatched()
{
    if (!m_fsWatcher || !QFileInfo::exists(m_targetPath)) {
        return;
    }
    if (!m_fsWatcher->files().contains(m_targetPath)) {
        m_fsWatcher->addPath(m_targetPath);
    }
}

} // namespace taskheader
