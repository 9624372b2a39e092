/*
 * mergedispatcher.cpp: Runs merge jobs on a background thread
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mergedispatcher.h"

#include "pageselection.h"
#include "pdfprovider.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStringList>

// --- Merge worker (runs in background thread) ---

class MergeDispatcher::MergeWorker : public QObject {
    Q_OBJECT
public:
    explicit MergeWorker(std::shared_ptr<const PdfProvider> provider)
        : m_provider(std::move(provider))
    {
    }

    void run(quint64 jobId, const MergeRequest &request)
    {
        MergeOutcome outcome;
        outcome.outputPath = request.outputPath;

        QStringList order;
        for (const MergeSource &source : request.sources)
            order << QFileInfo(source.filePath).fileName();
        qDebug() << "MergeDispatcher: merging in order:" << order;

        Q_EMIT progress(0);

        MergePlan plan;
        QString error;
        if (!MergeDispatcher::buildPlan(*m_provider, request, &plan, &error)) {
            outcome.message = error;
            Q_EMIT jobFinished(jobId, outcome);
            return;
        }

        const bool ok = m_provider->merge(
            plan, request.outputPath,
            [this](int done, int total) {
                if (total > 0)
                    Q_EMIT progress(qMin(99, done * 100 / total));
            },
            &error);

        if (ok) {
            outcome.success = true;
            outcome.pageCount = plan.totalPages();
            outcome.message = QObject::tr("Successfully merged %1 PDFs into %2")
                                  .arg(request.sources.size())
                                  .arg(request.outputPath);
            Q_EMIT progress(100);
        } else {
            qWarning() << "MergeDispatcher: merge failed:" << error;
            outcome.message = QObject::tr("Error during merge: %1").arg(error);
        }

        Q_EMIT jobFinished(jobId, outcome);
    }

Q_SIGNALS:
    void progress(int percent);
    void jobFinished(quint64 jobId, const MergeOutcome &outcome);

private:
    std::shared_ptr<const PdfProvider> m_provider;
};

// --- MergeDispatcher ---

MergeDispatcher::MergeDispatcher(std::shared_ptr<const PdfProvider> provider,
                                 QObject *parent)
    : QObject(parent)
    , m_provider(std::move(provider))
{
    qRegisterMetaType<MergeRequest>();
    qRegisterMetaType<MergeOutcome>();

    m_worker = new MergeWorker(m_provider);
    m_worker->moveToThread(&m_workerThread);

    connect(m_worker, &MergeWorker::progress,
            this, &MergeDispatcher::progressChanged, Qt::QueuedConnection);
    connect(m_worker, &MergeWorker::jobFinished,
            this, &MergeDispatcher::onJobFinished, Qt::QueuedConnection);

    m_workerThread.setObjectName(QStringLiteral("MergeWorker"));
    m_workerThread.start();
}

MergeDispatcher::~MergeDispatcher()
{
    // A running job completes; jobs still queued behind it are dropped.
    m_workerThread.quit();
    m_workerThread.wait();
    delete m_worker;
}

QString MergeDispatcher::targetKey(const QString &outputPath)
{
    return QDir::cleanPath(QFileInfo(outputPath).absoluteFilePath());
}

bool MergeDispatcher::isBusy(const QString &outputPath) const
{
    const QString key = targetKey(outputPath);
    for (const QString &target : m_activeTargets) {
        if (target == key)
            return true;
    }
    return false;
}

bool MergeDispatcher::submit(const MergeRequest &request)
{
    if (request.sources.isEmpty()) {
        qWarning() << "MergeDispatcher: refusing empty merge request";
        return false;
    }
    if (isBusy(request.outputPath)) {
        qWarning() << "MergeDispatcher: a merge into" << request.outputPath
                   << "is already running";
        return false;
    }

    const quint64 jobId = m_nextJobId++;
    m_activeTargets.insert(jobId, targetKey(request.outputPath));

    MergeWorker *worker = m_worker;
    QMetaObject::invokeMethod(worker, [worker, jobId, request]() {
        worker->run(jobId, request);
    }, Qt::QueuedConnection);
    return true;
}

void MergeDispatcher::onJobFinished(quint64 jobId, const MergeOutcome &outcome)
{
    m_activeTargets.remove(jobId);
    Q_EMIT finished(outcome);
}

bool MergeDispatcher::buildPlan(const PdfProvider &provider, const MergeRequest &request,
                                MergePlan *plan, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &message) {
        if (errorMessage)
            *errorMessage = message;
        return false;
    };

    if (request.sources.isEmpty())
        return fail(QObject::tr("No PDF files selected."));

    const QString target = targetKey(request.outputPath);
    for (const MergeSource &source : request.sources) {
        if (targetKey(source.filePath) == target) {
            return fail(QObject::tr("The output file %1 is also one of the input files.")
                            .arg(request.outputPath));
        }
    }

    MergePlan resolved;
    for (const MergeSource &source : request.sources) {
        const QString name = QFileInfo(source.filePath).fileName();

        QString readError;
        const int pages = provider.pageCount(source.filePath, &readError);
        if (pages < 0) {
            return fail(QObject::tr("Error processing %1: %2").arg(name, readError));
        }

        const PageSelection::Result selection = PageSelection::resolve(source.selection, pages);
        if (!selection.valid) {
            return fail(QObject::tr("Error processing %1: %2")
                            .arg(name, selection.errorMessage));
        }

        resolved.entries.append({source.filePath, selection.pages});
    }

    if (plan)
        *plan = resolved;
    return true;
}

#include "mergedispatcher.moc"
