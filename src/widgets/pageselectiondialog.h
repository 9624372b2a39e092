/*
 * pageselectiondialog.h: Per-file page selection before a merge
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_PAGESELECTIONDIALOG_H
#define PDFMERGER_PAGESELECTIONDIALOG_H

#include <QDialog>
#include <QList>

class QDialogButtonBox;
class QLineEdit;
class QVBoxLayout;
class PdfFileListModel;
class PdfProvider;

class PageSelectionDialog : public QDialog
{
    Q_OBJECT

public:
    // Reads the page count of every file in model through provider and
    // caches it in the model.
    PageSelectionDialog(PdfFileListModel *model, const PdfProvider *provider,
                        QWidget *parent = nullptr);

    // Write the edited expressions back to the model
    void applySelections();

private:
    struct FileRow {
        int modelRow = -1;
        int pageCount = -1;
        QLineEdit *edit = nullptr;   // null when the file could not be read
    };

    void addFileEntry(int modelRow, QVBoxLayout *layout);
    void onApplyDefaultToAll();
    void validateRow(const FileRow &row);
    void updateOkButton();

    PdfFileListModel *m_model;
    const PdfProvider *m_provider;
    QLineEdit *m_defaultEdit = nullptr;
    QDialogButtonBox *m_buttons = nullptr;
    QList<FileRow> m_rows;
};

#endif // PDFMERGER_PAGESELECTIONDIALOG_H
