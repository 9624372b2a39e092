/*
 * qpdfprovider.h: PdfProvider backed by qpdf
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_QPDFPROVIDER_H
#define PDFMERGER_QPDFPROVIDER_H

#include "pdfprovider.h"

class QpdfProvider : public PdfProvider
{
public:
    QpdfProvider() = default;

    int pageCount(const QString &filePath, QString *errorMessage) const override;
    bool merge(const MergePlan &plan, const QString &outputPath,
               const ProgressCallback &progress,
               QString *errorMessage) const override;
};

#endif // PDFMERGER_QPDFPROVIDER_H
