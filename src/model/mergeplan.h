/*
 * mergeplan.h: Value types passed between the file list, the merge
 * dispatcher and the PDF provider
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_MERGEPLAN_H
#define PDFMERGER_MERGEPLAN_H

#include <QList>
#include <QMetaType>
#include <QString>

// One input row as the user configured it.
struct MergeSource {
    QString filePath;
    QString selection;      // raw page selection expression
};

// Snapshot of the file list taken when a merge is started. The worker only
// ever sees this copy, never the live model.
struct MergeRequest {
    QList<MergeSource> sources;
    QString outputPath;
};

struct MergePlanEntry {
    QString filePath;
    QList<int> pages;       // 1-based, in output order
};

// Resolved assembly order for the output document.
struct MergePlan {
    QList<MergePlanEntry> entries;

    int totalPages() const
    {
        int total = 0;
        for (const MergePlanEntry &entry : entries)
            total += entry.pages.size();
        return total;
    }
};

// Terminal result of one merge job.
struct MergeOutcome {
    bool success = false;
    QString outputPath;
    QString message;
    int pageCount = 0;      // pages written, 0 on failure
};

Q_DECLARE_METATYPE(MergeRequest)
Q_DECLARE_METATYPE(MergeOutcome)

#endif // PDFMERGER_MERGEPLAN_H
