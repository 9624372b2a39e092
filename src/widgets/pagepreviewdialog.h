/*
 * pagepreviewdialog.h: Thumbnail grid of every page of one PDF
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_PAGEPREVIEWDIALOG_H
#define PDFMERGER_PAGEPREVIEWDIALOG_H

#include <QDialog>
#include <QList>

class QGridLayout;
class QImage;
class QLabel;
class ThumbnailRenderer;

class PagePreviewDialog : public QDialog
{
    Q_OBJECT

public:
    PagePreviewDialog(const QString &filePath, int thumbnailSize,
                      QWidget *parent = nullptr);

private:
    void onDocumentOpened(int pageCount);
    void onThumbnailReady(int pageNumber, const QImage &image);
    void onFailed(const QString &message);

    static constexpr int Columns = 4;

    int m_thumbnailSize;
    ThumbnailRenderer *m_renderer = nullptr;
    QLabel *m_statusLabel = nullptr;
    QGridLayout *m_grid = nullptr;
    QList<QLabel *> m_imageLabels;
};

#endif // PDFMERGER_PAGEPREVIEWDIALOG_H
