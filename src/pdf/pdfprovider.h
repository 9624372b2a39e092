// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef PDFMERGER_PDFPROVIDER_H
#define PDFMERGER_PDFPROVIDER_H

#include <QString>

#include <functional>

#include "mergeplan.h"

// Reads and writes PDF files on behalf of the merge pipeline.
// Implementations must be usable from the merge worker thread.
class PdfProvider
{
public:
    // Called once per plan entry: (entries done, entries total)
    using ProgressCallback = std::function<void(int, int)>;

    virtual ~PdfProvider() = default;

    // Number of pages in filePath, or -1 with *errorMessage set.
    virtual int pageCount(const QString &filePath, QString *errorMessage) const = 0;

    // Write the planned pages, in plan order, to outputPath. On failure
    // nothing is written and *errorMessage describes the problem.
    virtual bool merge(const MergePlan &plan, const QString &outputPath,
                       const ProgressCallback &progress,
                       QString *errorMessage) const = 0;
};

#endif // PDFMERGER_PDFPROVIDER_H
