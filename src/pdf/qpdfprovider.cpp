/*
 * qpdfprovider.cpp: PdfProvider backed by qpdf
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "qpdfprovider.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QSaveFile>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <memory>
#include <vector>

namespace {

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage)
        *errorMessage = message;
}

// Open a file for reading; qpdf reports problems by throwing QPDFExc.
std::unique_ptr<QPDF> openDocument(const QString &filePath)
{
    auto pdf = std::make_unique<QPDF>();
    pdf->setSuppressWarnings(true);
    pdf->processFile(QFile::encodeName(filePath).constData());
    if (pdf->anyWarnings())
        qWarning() << "QpdfProvider: recovered from damage in" << filePath;
    return pdf;
}

} // namespace

int QpdfProvider::pageCount(const QString &filePath, QString *errorMessage) const
{
    if (!QFileInfo::exists(filePath)) {
        setError(errorMessage, QObject::tr("File does not exist: %1").arg(filePath));
        return -1;
    }

    try {
        std::unique_ptr<QPDF> pdf = openDocument(filePath);
        const auto pages = QPDFPageDocumentHelper(*pdf).getAllPages();
        return static_cast<int>(pages.size());
    } catch (const std::exception &e) {
        qWarning() << "QpdfProvider: cannot read" << filePath << e.what();
        setError(errorMessage, QString::fromLocal8Bit(e.what()));
        return -1;
    }
}

bool QpdfProvider::merge(const MergePlan &plan, const QString &outputPath,
                         const ProgressCallback &progress,
                         QString *errorMessage) const
{
    if (plan.entries.isEmpty() || plan.totalPages() == 0) {
        setError(errorMessage, QObject::tr("No pages to merge"));
        return false;
    }

    std::shared_ptr<Buffer> buffer;
    try {
        QPDF out;
        out.emptyPDF();
        QPDFPageDocumentHelper outPages(out);

        // Copied pages keep referring to their source documents until the
        // writer has run, so every source stays open until then.
        std::vector<std::unique_ptr<QPDF>> sources;
        sources.reserve(plan.entries.size());

        const int total = plan.entries.size();
        for (int i = 0; i < total; ++i) {
            const MergePlanEntry &entry = plan.entries.at(i);
            std::unique_ptr<QPDF> in = openDocument(entry.filePath);
            std::vector<QPDFPageObjectHelper> pages =
                QPDFPageDocumentHelper(*in).getAllPages();
            const int available = static_cast<int>(pages.size());

            for (int page : entry.pages) {
                if (page < 1 || page > available) {
                    setError(errorMessage,
                             QObject::tr("Page %1 does not exist in %2 (%3 pages)")
                                 .arg(page)
                                 .arg(QFileInfo(entry.filePath).fileName())
                                 .arg(available));
                    return false;
                }
                outPages.addPage(pages[page - 1], false);
            }

            sources.push_back(std::move(in));
            if (progress)
                progress(i + 1, total);
        }

        QPDFWriter writer(out);
        writer.setOutputMemory();
        writer.write();
        buffer = writer.getBufferSharedPointer();
    } catch (const std::exception &e) {
        qWarning() << "QpdfProvider: merge into" << outputPath << "failed:" << e.what();
        setError(errorMessage, QString::fromLocal8Bit(e.what()));
        return false;
    }

    // QSaveFile only replaces outputPath on commit, so a failed write
    // never leaves a truncated file behind.
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorMessage, QObject::tr("Cannot write %1: %2")
                                   .arg(outputPath, file.errorString()));
        return false;
    }

    const qint64 size = static_cast<qint64>(buffer->getSize());
    if (file.write(reinterpret_cast<const char *>(buffer->getBuffer()), size) != size
        || !file.commit()) {
        setError(errorMessage, QObject::tr("Cannot write %1: %2")
                                   .arg(outputPath, file.errorString()));
        file.cancelWriting();
        return false;
    }

    return true;
}
