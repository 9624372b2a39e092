#ifndef PDFMERGER_PDFLISTVIEW_H
#define PDFMERGER_PDFLISTVIEW_H

#include <QListView>

class QDragEnterEvent;
class QDragMoveEvent;
class QDropEvent;
class QMimeData;

// File list that accepts PDFs dropped from outside the application and,
// when reordering is on, rows dragged within itself.
class PdfListView : public QListView
{
    Q_OBJECT

public:
    explicit PdfListView(QWidget *parent = nullptr);

    void setReorderEnabled(bool enabled);
    bool isReorderEnabled() const { return m_reorderEnabled; }

    // Local PDF paths carried by a drag, if any
    static QStringList pdfPaths(const QMimeData *mimeData);

Q_SIGNALS:
    void filesDropped(const QStringList &paths);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dragMoveEvent(QDragMoveEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private:
    bool isExternalFileDrag(const QDropEvent *event) const;

    bool m_reorderEnabled = false;
};

#endif // PDFMERGER_PDFLISTVIEW_H
