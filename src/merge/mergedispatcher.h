/*
 * mergedispatcher.h: Runs merge jobs on a background thread
 *
 * Each accepted job resolves its page selections, hands the plan to the
 * PDF provider and reports exactly one MergeOutcome back on the thread
 * that owns the dispatcher.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_MERGEDISPATCHER_H
#define PDFMERGER_MERGEDISPATCHER_H

#include <QHash>
#include <QObject>
#include <QString>
#include <QThread>

#include <memory>

#include "mergeplan.h"

class PdfProvider;

class MergeDispatcher : public QObject
{
    Q_OBJECT

public:
    explicit MergeDispatcher(std::shared_ptr<const PdfProvider> provider,
                             QObject *parent = nullptr);
    ~MergeDispatcher() override;

    // Queue a merge. Returns false, and queues nothing, when the request
    // has no sources or a job writing the same output is still running.
    bool submit(const MergeRequest &request);

    bool isBusy() const { return !m_activeTargets.isEmpty(); }
    bool isBusy(const QString &outputPath) const;

    // Resolve every source of request into a plan. Used by the worker;
    // exposed for callers that want to validate a request up front.
    static bool buildPlan(const PdfProvider &provider, const MergeRequest &request,
                          MergePlan *plan, QString *errorMessage);

Q_SIGNALS:
    void progressChanged(int percent);
    void finished(const MergeOutcome &outcome);

private Q_SLOTS:
    void onJobFinished(quint64 jobId, const MergeOutcome &outcome);

private:
    static QString targetKey(const QString &outputPath);

    std::shared_ptr<const PdfProvider> m_provider;
    QHash<quint64, QString> m_activeTargets;   // job id -> output target
    quint64 m_nextJobId = 1;

    class MergeWorker;
    QThread m_workerThread;
    MergeWorker *m_worker = nullptr;
};

#endif // PDFMERGER_MERGEDISPATCHER_H
