/*
 * pageselectiondialog.cpp: Per-file page selection before a merge
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageselectiondialog.h"

#include "pagepreviewdialog.h"
#include "pageselection.h"
#include "pdffilelistmodel.h"
#include "pdfmergersettings.h"
#include "pdfprovider.h"

#include <QDialogButtonBox>
#include <QFileInfo>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QVBoxLayout>

#include <KLocalizedString>

PageSelectionDialog::PageSelectionDialog(PdfFileListModel *model,
                                         const PdfProvider *provider,
                                         QWidget *parent)
    : QDialog(parent)
    , m_model(model)
    , m_provider(provider)
{
    setWindowTitle(i18n("Page Selection"));
    setMinimumSize(600, 500);

    auto *layout = new QVBoxLayout(this);

    auto *helpLabel = new QLabel(
        i18n("Specify which pages to include or exclude from each PDF.\n"
             "Use commas for multiple pages and hyphens for ranges.\n"
             "Examples:\n"
             "• Include pages 1, 3, 5-7: '1,3,5-7'\n"
             "• Exclude first page: '-1'\n"
             "• Exclude pages 1-2: '-1,-2' or '-1-2'\n"
             "• Include all pages: leave blank or 'all'"),
        this);
    helpLabel->setWordWrap(true);
    layout->addWidget(helpLabel);

    // Default applied to every file
    auto *defaultRow = new QHBoxLayout;
    defaultRow->addWidget(new QLabel(i18n("Default for all files:"), this));
    m_defaultEdit = new QLineEdit(PdfMergerSettings::self()->defaultSelection(), this);
    defaultRow->addWidget(m_defaultEdit, 1);
    auto *applyButton = new QPushButton(i18n("Apply to All"), this);
    defaultRow->addWidget(applyButton);
    layout->addLayout(defaultRow);

    connect(applyButton, &QPushButton::clicked,
            this, &PageSelectionDialog::onApplyDefaultToAll);

    // Scrollable list of files
    auto *scrollArea = new QScrollArea(this);
    scrollArea->setWidgetResizable(true);
    auto *scrollContent = new QWidget;
    auto *scrollLayout = new QVBoxLayout(scrollContent);

    for (int row = 0; row < m_model->rowCount(); ++row)
        addFileEntry(row, scrollLayout);
    scrollLayout->addStretch();

    scrollArea->setWidget(scrollContent);
    layout->addWidget(scrollArea, 1);

    m_buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    connect(m_buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(m_buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(m_buttons);

    for (const FileRow &row : std::as_const(m_rows))
        validateRow(row);
    updateOkButton();
}

void PageSelectionDialog::addFileEntry(int modelRow, QVBoxLayout *layout)
{
    const QString filePath = m_model->filePath(modelRow);

    auto *fileGroup = new QGroupBox(QFileInfo(filePath).fileName());
    fileGroup->setToolTip(filePath);
    auto *fileLayout = new QVBoxLayout(fileGroup);

    FileRow row;
    row.modelRow = modelRow;

    QString error;
    row.pageCount = m_provider->pageCount(filePath, &error);
    m_model->setPageCount(modelRow, row.pageCount);

    if (row.pageCount < 0) {
        auto *errorLabel = new QLabel(i18n("Error reading PDF: %1", error), fileGroup);
        errorLabel->setWordWrap(true);
        fileLayout->addWidget(errorLabel);
        layout->addWidget(fileGroup);
        m_rows.append(row);
        return;
    }

    auto *infoRow = new QHBoxLayout;
    infoRow->addWidget(new QLabel(i18n("Total pages: %1", row.pageCount), fileGroup));
    auto *previewButton = new QPushButton(i18n("Preview Pages"), fileGroup);
    infoRow->addWidget(previewButton);
    infoRow->addStretch();
    fileLayout->addLayout(infoRow);

    connect(previewButton, &QPushButton::clicked, this, [this, filePath]() {
        PagePreviewDialog dlg(filePath, PdfMergerSettings::self()->thumbnailSize(), this);
        dlg.exec();
    });

    auto *selectionRow = new QHBoxLayout;
    selectionRow->addWidget(new QLabel(i18n("Pages to include/exclude:"), fileGroup));
    row.edit = new QLineEdit(m_model->selection(modelRow), fileGroup);
    row.edit->setPlaceholderText(i18n("all"));
    selectionRow->addWidget(row.edit, 1);
    fileLayout->addLayout(selectionRow);

    connect(row.edit, &QLineEdit::textChanged, this, [this, row]() {
        validateRow(row);
        updateOkButton();
    });

    layout->addWidget(fileGroup);
    m_rows.append(row);
}

void PageSelectionDialog::onApplyDefaultToAll()
{
    const QString expr = m_defaultEdit->text();
    for (const FileRow &row : std::as_const(m_rows)) {
        if (row.edit)
            row.edit->setText(expr);
    }
}

void PageSelectionDialog::validateRow(const FileRow &row)
{
    if (!row.edit)
        return;

    auto result = PageSelection::resolve(row.edit->text(), row.pageCount);
    if (!result.valid) {
        row.edit->setStyleSheet(QStringLiteral("QLineEdit { border: 1px solid red; }"));
        row.edit->setToolTip(result.errorMessage);
    } else {
        row.edit->setStyleSheet(QString());
        row.edit->setToolTip(i18np("%1 page selected", "%1 pages selected",
                                   result.pages.size()));
    }
}

void PageSelectionDialog::updateOkButton()
{
    bool allValid = true;
    for (const FileRow &row : std::as_const(m_rows)) {
        if (row.edit && !PageSelection::resolve(row.edit->text(), row.pageCount).valid) {
            allValid = false;
            break;
        }
    }
    m_buttons->button(QDialogButtonBox::Ok)->setEnabled(allValid);
}

void PageSelectionDialog::applySelections()
{
    for (const FileRow &row : std::as_const(m_rows)) {
        if (row.edit)
            m_model->setSelection(row.modelRow, row.edit->text().trimmed());
    }
}
