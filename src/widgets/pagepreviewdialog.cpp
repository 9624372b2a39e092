/*
 * pagepreviewdialog.cpp: Thumbnail grid of every page of one PDF
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagepreviewdialog.h"
#include "thumbnailrenderer.h"

#include <QDialogButtonBox>
#include <QFileInfo>
#include <QGridLayout>
#include <QLabel>
#include <QPixmap>
#include <QScrollArea>
#include <QVBoxLayout>

#include <KLocalizedString>

PagePreviewDialog::PagePreviewDialog(const QString &filePath, int thumbnailSize,
                                     QWidget *parent)
    : QDialog(parent)
    , m_thumbnailSize(thumbnailSize)
    , m_renderer(new ThumbnailRenderer(this))
{
    setWindowTitle(i18n("Preview: %1", QFileInfo(filePath).fileName()));
    setMinimumSize(800, 600);

    auto *layout = new QVBoxLayout(this);

    m_statusLabel = new QLabel(i18n("Loading pages..."), this);
    layout->addWidget(m_statusLabel);

    auto *scrollArea = new QScrollArea(this);
    scrollArea->setWidgetResizable(true);
    auto *content = new QWidget;
    m_grid = new QGridLayout(content);
    m_grid->setAlignment(Qt::AlignTop | Qt::AlignLeft);
    scrollArea->setWidget(content);
    layout->addWidget(scrollArea, 1);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Close, this);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttons);

    connect(m_renderer, &ThumbnailRenderer::documentOpened,
            this, &PagePreviewDialog::onDocumentOpened);
    connect(m_renderer, &ThumbnailRenderer::thumbnailReady,
            this, &PagePreviewDialog::onThumbnailReady);
    connect(m_renderer, &ThumbnailRenderer::failed,
            this, &PagePreviewDialog::onFailed);

    m_renderer->render(filePath, m_thumbnailSize);
}

void PagePreviewDialog::onDocumentOpened(int pageCount)
{
    m_statusLabel->setText(i18np("%1 page", "%1 pages", pageCount));

    QWidget *content = m_grid->parentWidget();
    for (int i = 0; i < pageCount; ++i) {
        auto *cell = new QWidget(content);
        auto *cellLayout = new QVBoxLayout(cell);
        cellLayout->setContentsMargins(4, 4, 4, 4);

        auto *image = new QLabel(cell);
        image->setFixedSize(m_thumbnailSize, m_thumbnailSize);
        image->setAlignment(Qt::AlignCenter);
        image->setFrameShape(QFrame::Box);
        cellLayout->addWidget(image);

        auto *caption = new QLabel(i18n("Page %1", i + 1), cell);
        caption->setAlignment(Qt::AlignCenter);
        cellLayout->addWidget(caption);

        m_grid->addWidget(cell, i / Columns, i % Columns);
        m_imageLabels.append(image);
    }
}

void PagePreviewDialog::onThumbnailReady(int pageNumber, const QImage &image)
{
    if (pageNumber < 0 || pageNumber >= m_imageLabels.size())
        return;
    m_imageLabels[pageNumber]->setPixmap(QPixmap::fromImage(image));
}

void PagePreviewDialog::onFailed(const QString &message)
{
    m_statusLabel->setText(i18n("Error loading preview: %1", message));
}
