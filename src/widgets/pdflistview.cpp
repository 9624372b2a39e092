#include "pdflistview.h"

#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileInfo>
#include <QMimeData>
#include <QUrl>

PdfListView::PdfListView(QWidget *parent)
    : QListView(parent)
{
    setAcceptDrops(true);
    setDropIndicatorShown(true);
    setDefaultDropAction(Qt::MoveAction);
    setSelectionMode(QAbstractItemView::ExtendedSelection);
    setDragDropMode(QAbstractItemView::DropOnly);
}

void PdfListView::setReorderEnabled(bool enabled)
{
    m_reorderEnabled = enabled;
    // Dragging rows needs single selection so one file moves at a time
    setDragEnabled(enabled);
    setDragDropMode(enabled ? QAbstractItemView::DragDrop : QAbstractItemView::DropOnly);
    setSelectionMode(enabled ? QAbstractItemView::SingleSelection
                             : QAbstractItemView::ExtendedSelection);
}

QStringList PdfListView::pdfPaths(const QMimeData *mimeData)
{
    QStringList paths;
    if (!mimeData || !mimeData->hasUrls())
        return paths;
    const QList<QUrl> urls = mimeData->urls();
    for (const QUrl &url : urls) {
        if (!url.isLocalFile())
            continue;
        const QString path = url.toLocalFile();
        QFileInfo fi(path);
        if (fi.isFile() && fi.suffix().compare(QLatin1String("pdf"), Qt::CaseInsensitive) == 0)
            paths.append(fi.absoluteFilePath());
    }
    return paths;
}

bool PdfListView::isExternalFileDrag(const QDropEvent *event) const
{
    return event->source() != this && !pdfPaths(event->mimeData()).isEmpty();
}

void PdfListView::dragEnterEvent(QDragEnterEvent *event)
{
    if (isExternalFileDrag(event)) {
        // Never let the file manager treat this as a move
        event->setDropAction(Qt::CopyAction);
        event->accept();
    } else {
        QListView::dragEnterEvent(event);
    }
}

void PdfListView::dragMoveEvent(QDragMoveEvent *event)
{
    if (isExternalFileDrag(event)) {
        event->setDropAction(Qt::CopyAction);
        event->accept();
    } else {
        QListView::dragMoveEvent(event);
    }
}

void PdfListView::dropEvent(QDropEvent *event)
{
    if (isExternalFileDrag(event)) {
        const QStringList paths = pdfPaths(event->mimeData());
        event->setDropAction(Qt::CopyAction);
        event->accept();
        Q_EMIT filesDropped(paths);
    } else {
        QListView::dropEvent(event);
    }
}
