// SPDX-License-Identifier: GPL-2.0-or-later

#include "pdffilelistmodel.h"

#include <QDataStream>
#include <QDir>
#include <QFileInfo>
#include <QIODevice>
#include <QMimeData>
#include <QRegularExpression>

#include <algorithm>
#include <limits>

namespace {
const QString s_rowsMimeType = QStringLiteral("application/x-pdfmerger-rows");
}

PdfFileListModel::PdfFileListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

QString PdfFileListModel::normalizedPath(const QString &path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

int PdfFileListModel::addFiles(const QStringList &paths)
{
    QList<Entry> added;
    for (const QString &path : paths) {
        const QString normalized = normalizedPath(path);
        if (contains(normalized))
            continue;
        const bool duplicate = std::any_of(added.cbegin(), added.cend(),
                                           [&normalized](const Entry &e) {
            return e.filePath == normalized;
        });
        if (duplicate)
            continue;
        added.append({normalized, m_defaultSelection, -1});
    }

    if (added.isEmpty())
        return 0;

    const int first = m_entries.size();
    beginInsertRows(QModelIndex(), first, first + added.size() - 1);
    m_entries.append(added);
    endInsertRows();
    return added.size();
}

bool PdfFileListModel::contains(const QString &path) const
{
    const QString normalized = normalizedPath(path);
    return std::any_of(m_entries.cbegin(), m_entries.cend(),
                       [&normalized](const Entry &e) { return e.filePath == normalized; });
}

void PdfFileListModel::clear()
{
    if (m_entries.isEmpty())
        return;
    beginResetModel();
    m_entries.clear();
    endResetModel();
}

QString PdfFileListModel::filePath(int row) const
{
    if (row < 0 || row >= m_entries.size())
        return QString();
    return m_entries.at(row).filePath;
}

QStringList PdfFileListModel::filePaths() const
{
    QStringList paths;
    paths.reserve(m_entries.size());
    for (const Entry &e : m_entries)
        paths.append(e.filePath);
    return paths;
}

QString PdfFileListModel::selection(int row) const
{
    if (row < 0 || row >= m_entries.size())
        return QString();
    return m_entries.at(row).selection;
}

void PdfFileListModel::setSelection(int row, const QString &expr)
{
    setData(index(row), expr, SelectionRole);
}

void PdfFileListModel::applySelectionToAll(const QString &expr)
{
    if (m_entries.isEmpty())
        return;
    for (Entry &e : m_entries)
        e.selection = expr;
    Q_EMIT dataChanged(index(0), index(m_entries.size() - 1), {SelectionRole});
}

int PdfFileListModel::pageCount(int row) const
{
    if (row < 0 || row >= m_entries.size())
        return -1;
    return m_entries.at(row).pageCount;
}

void PdfFileListModel::setPageCount(int row, int count)
{
    setData(index(row), count, PageCountRole);
}

bool PdfFileListModel::moveUp(int row)
{
    if (row <= 0 || row >= m_entries.size())
        return false;
    return moveRows(QModelIndex(), row, 1, QModelIndex(), row - 1);
}

bool PdfFileListModel::moveDown(int row)
{
    if (row < 0 || row >= m_entries.size() - 1)
        return false;
    return moveRows(QModelIndex(), row, 1, QModelIndex(), row + 2);
}

void PdfFileListModel::sortAlphabetically()
{
    beginResetModel();
    std::stable_sort(m_entries.begin(), m_entries.end(),
                     [](const Entry &a, const Entry &b) {
        return QFileInfo(a.filePath).fileName().compare(
                   QFileInfo(b.filePath).fileName(), Qt::CaseInsensitive) < 0;
    });
    endResetModel();
}

void PdfFileListModel::sortNumerically()
{
    beginResetModel();
    std::stable_sort(m_entries.begin(), m_entries.end(),
                     [](const Entry &a, const Entry &b) {
        return leadingNumber(QFileInfo(a.filePath).fileName())
               < leadingNumber(QFileInfo(b.filePath).fileName());
    });
    endResetModel();
}

qulonglong PdfFileListModel::leadingNumber(const QString &fileName)
{
    static const QRegularExpression digitsRe(QStringLiteral("\\d+"));
    const auto m = digitsRe.match(fileName);
    if (!m.hasMatch())
        return 0;
    bool ok = false;
    const qulonglong value = m.captured(0).toULongLong(&ok);
    return ok ? value : std::numeric_limits<qulonglong>::max();
}

void PdfFileListModel::setReorderEnabled(bool enabled)
{
    if (m_reorderEnabled == enabled)
        return;
    m_reorderEnabled = enabled;
    if (!m_entries.isEmpty())
        Q_EMIT dataChanged(index(0), index(m_entries.size() - 1));
}

MergeRequest PdfFileListModel::mergeRequest(const QString &outputPath) const
{
    MergeRequest request;
    request.outputPath = outputPath;
    request.sources.reserve(m_entries.size());
    for (const Entry &e : m_entries)
        request.sources.append({e.filePath, e.selection});
    return request;
}

// --- QAbstractItemModel interface ---

int PdfFileListModel::rowCount(const QModelIndex &parent) const
{
    return parent.isValid() ? 0 : m_entries.size();
}

QVariant PdfFileListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_entries.size())
        return {};

    const Entry &e = m_entries.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return QFileInfo(e.filePath).fileName();
    case Qt::ToolTipRole:
        return e.filePath;
    case FilePathRole:
        return e.filePath;
    case SelectionRole:
        return e.selection;
    case PageCountRole:
        return e.pageCount;
    default:
        return {};
    }
}

bool PdfFileListModel::setData(const QModelIndex &index, const QVariant &value, int role)
{
    if (!index.isValid() || index.row() >= m_entries.size())
        return false;

    Entry &e = m_entries[index.row()];
    if (role == SelectionRole) {
        const QString expr = value.toString();
        if (e.selection == expr)
            return true;
        e.selection = expr;
    } else if (role == PageCountRole) {
        bool ok = false;
        const int count = value.toInt(&ok);
        if (!ok)
            return false;
        e.pageCount = count;
    } else {
        return false;
    }

    Q_EMIT dataChanged(index, index, {role});
    return true;
}

Qt::ItemFlags PdfFileListModel::flags(const QModelIndex &index) const
{
    Qt::ItemFlags f = QAbstractListModel::flags(index);
    if (!m_reorderEnabled)
        return f;
    if (index.isValid())
        f |= Qt::ItemIsDragEnabled;
    else
        f |= Qt::ItemIsDropEnabled;
    return f;
}

bool PdfFileListModel::removeRows(int row, int count, const QModelIndex &parent)
{
    if (parent.isValid() || count < 1 || row < 0 || row + count > m_entries.size())
        return false;

    beginRemoveRows(QModelIndex(), row, row + count - 1);
    m_entries.remove(row, count);
    endRemoveRows();
    return true;
}

bool PdfFileListModel::moveRows(const QModelIndex &sourceParent, int sourceRow, int count,
                                const QModelIndex &destinationParent, int destinationChild)
{
    if (sourceParent.isValid() || destinationParent.isValid())
        return false;
    if (count < 1 || sourceRow < 0 || sourceRow + count > m_entries.size())
        return false;
    if (destinationChild < 0 || destinationChild > m_entries.size())
        return false;
    // Moving a block onto itself
    if (destinationChild >= sourceRow && destinationChild <= sourceRow + count)
        return false;

    if (!beginMoveRows(QModelIndex(), sourceRow, sourceRow + count - 1,
                       QModelIndex(), destinationChild))
        return false;

    const QList<Entry> moved = m_entries.mid(sourceRow, count);
    m_entries.remove(sourceRow, count);
    const int insertAt = destinationChild > sourceRow ? destinationChild - count
                                                      : destinationChild;
    for (int i = 0; i < moved.size(); ++i)
        m_entries.insert(insertAt + i, moved.at(i));

    endMoveRows();
    return true;
}

Qt::DropActions PdfFileListModel::supportedDropActions() const
{
    return Qt::MoveAction;
}

QStringList PdfFileListModel::mimeTypes() const
{
    return {s_rowsMimeType};
}

QMimeData *PdfFileListModel::mimeData(const QModelIndexList &indexes) const
{
    QList<int> rows;
    for (const QModelIndex &index : indexes) {
        if (index.isValid() && !rows.contains(index.row()))
            rows.append(index.row());
    }
    std::sort(rows.begin(), rows.end());

    QByteArray encoded;
    QDataStream stream(&encoded, QIODevice::WriteOnly);
    stream << rows;

    auto *mime = new QMimeData;
    mime->setData(s_rowsMimeType, encoded);
    return mime;
}

bool PdfFileListModel::dropMimeData(const QMimeData *data, Qt::DropAction action,
                                    int row, int column, const QModelIndex &parent)
{
    Q_UNUSED(column);

    if (action == Qt::IgnoreAction)
        return true;
    if (action != Qt::MoveAction || !data || !data->hasFormat(s_rowsMimeType))
        return false;

    QList<int> rows;
    QDataStream stream(data->data(s_rowsMimeType));
    stream >> rows;
    if (rows.isEmpty())
        return false;

    int destination = row;
    if (destination < 0)
        destination = parent.isValid() ? parent.row() : m_entries.size();

    // Rows above the drop point slide up as they leave; rows below it are
    // inserted one after another so their relative order survives.
    // A row dropped where it already is makes moveRows() refuse; it stays put.
    int insertPos = destination;
    int movedFromAbove = 0;
    for (int source : std::as_const(rows)) {
        if (source < 0 || source >= m_entries.size())
            continue;
        if (source < destination) {
            moveRows(QModelIndex(), source - movedFromAbove, 1, QModelIndex(), insertPos);
            ++movedFromAbove;
        } else {
            moveRows(QModelIndex(), source, 1, QModelIndex(), insertPos);
            ++insertPos;
        }
    }

    // The rows are already in place. Reporting the drop as unhandled keeps
    // the view from removing the dragged rows afterwards.
    return false;
}
