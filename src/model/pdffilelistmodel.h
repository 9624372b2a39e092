// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef PDFMERGER_PDFFILELISTMODEL_H
#define PDFMERGER_PDFFILELISTMODEL_H

#include <QAbstractListModel>
#include <QList>
#include <QStringList>

#include "mergeplan.h"

class PdfFileListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        FilePathRole = Qt::UserRole + 1,
        SelectionRole,
        PageCountRole,
    };

    explicit PdfFileListModel(QObject *parent = nullptr);

    // Appends files not already in the list. Returns the number added.
    int addFiles(const QStringList &paths);
    bool contains(const QString &path) const;
    void clear();

    QString filePath(int row) const;
    QStringList filePaths() const;

    QString selection(int row) const;
    void setSelection(int row, const QString &expr);
    void applySelectionToAll(const QString &expr);

    // Selection given to newly added files
    QString defaultSelection() const { return m_defaultSelection; }
    void setDefaultSelection(const QString &expr) { m_defaultSelection = expr; }

    // -1 until known
    int pageCount(int row) const;
    void setPageCount(int row, int count);

    bool moveUp(int row);
    bool moveDown(int row);
    void sortAlphabetically();
    void sortNumerically();

    // Drag-and-drop reordering; off by default
    bool isReorderEnabled() const { return m_reorderEnabled; }
    void setReorderEnabled(bool enabled);

    MergeRequest mergeRequest(const QString &outputPath) const;

    // First run of digits in fileName, 0 if there is none.
    static qulonglong leadingNumber(const QString &fileName);

    // QAbstractItemModel interface
    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    bool setData(const QModelIndex &index, const QVariant &value, int role = Qt::EditRole) override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    bool removeRows(int row, int count, const QModelIndex &parent = QModelIndex()) override;
    bool moveRows(const QModelIndex &sourceParent, int sourceRow, int count,
                  const QModelIndex &destinationParent, int destinationChild) override;

    Qt::DropActions supportedDropActions() const override;
    QStringList mimeTypes() const override;
    QMimeData *mimeData(const QModelIndexList &indexes) const override;
    bool dropMimeData(const QMimeData *data, Qt::DropAction action,
                      int row, int column, const QModelIndex &parent) override;

private:
    struct Entry {
        QString filePath;
        QString selection;
        int pageCount = -1;
    };

    static QString normalizedPath(const QString &path);

    QList<Entry> m_entries;
    QString m_defaultSelection = QStringLiteral("-1");
    bool m_reorderEnabled = false;
};

#endif // PDFMERGER_PDFFILELISTMODEL_H
