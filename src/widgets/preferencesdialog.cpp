#include "preferencesdialog.h"
#include "pageselection.h"
#include "pdfmergersettings.h"

#include <KLocalizedString>

#include <QCheckBox>
#include <QDialogButtonBox>
#include <QPushButton>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QVBoxLayout>

PdfMergerConfigDialog::PdfMergerConfigDialog(QWidget *parent)
    : KConfigDialog(parent, QStringLiteral("settings"), PdfMergerSettings::self())
{
    // ===== General Page =====
    auto *generalPage = new QWidget;
    auto *generalLayout = new QVBoxLayout(generalPage);

    auto *selectionGroup = new QGroupBox(i18n("Page Selection"));
    auto *selectionGroupLayout = new QVBoxLayout(selectionGroup);

    auto *defaultRow = new QHBoxLayout;
    defaultRow->addWidget(new QLabel(i18n("Default selection for new files:")));
    m_defaultSelectionEdit = new QLineEdit;
    m_defaultSelectionEdit->setObjectName(QStringLiteral("kcfg_DefaultSelection"));
    m_defaultSelectionEdit->setPlaceholderText(i18n("all"));
    defaultRow->addWidget(m_defaultSelectionEdit, 1);
    selectionGroupLayout->addLayout(defaultRow);

    auto *rememberCheck = new QCheckBox(i18n("Remember page selections per file"));
    rememberCheck->setObjectName(QStringLiteral("kcfg_RememberSelections"));
    selectionGroupLayout->addWidget(rememberCheck);

    generalLayout->addWidget(selectionGroup);

    auto *mergeGroup = new QGroupBox(i18n("Merging"));
    auto *mergeGroupLayout = new QVBoxLayout(mergeGroup);
    auto *confirmCheck = new QCheckBox(i18n("Confirm merge order before saving"));
    confirmCheck->setObjectName(QStringLiteral("kcfg_ConfirmBeforeMerge"));
    mergeGroupLayout->addWidget(confirmCheck);
    generalLayout->addWidget(mergeGroup);

    generalLayout->addStretch();

    addPage(generalPage, i18n("General"), QStringLiteral("preferences-other"));

    // ===== Preview Page =====
    auto *previewPage = new QWidget;
    auto *previewLayout = new QVBoxLayout(previewPage);

    auto *sizeRow = new QHBoxLayout;
    sizeRow->addWidget(new QLabel(i18n("Thumbnail size:")));
    auto *sizeSpin = new QSpinBox;
    sizeSpin->setObjectName(QStringLiteral("kcfg_ThumbnailSize"));
    sizeSpin->setRange(64, 512);
    sizeSpin->setSingleStep(16);
    sizeSpin->setSuffix(i18n(" px"));
    sizeRow->addWidget(sizeSpin);
    sizeRow->addStretch();
    previewLayout->addLayout(sizeRow);
    previewLayout->addStretch();

    addPage(previewPage, i18n("Preview"), QStringLiteral("view-preview"));

    // Connected after addPage() so this runs after KConfigDialog has
    // updated its own button state
    connect(m_defaultSelectionEdit, &QLineEdit::textChanged,
            this, &PdfMergerConfigDialog::validateDefaultSelection);
    validateDefaultSelection();
}

void PdfMergerConfigDialog::validateDefaultSelection()
{
    // Applies to documents of any length, so only the syntax is checked
    auto result = PageSelection::checkSyntax(m_defaultSelectionEdit->text());
    if (!result.valid) {
        m_defaultSelectionEdit->setStyleSheet(
            QStringLiteral("QLineEdit { border: 1px solid red; }"));
        m_defaultSelectionEdit->setToolTip(result.errorMessage);
    } else {
        m_defaultSelectionEdit->setStyleSheet(QString());
        m_defaultSelectionEdit->setToolTip(QString());
    }

    // An invalid default would be applied to every file added later
    buttonBox()->button(QDialogButtonBox::Ok)->setEnabled(result.valid);
    if (!result.valid)
        buttonBox()->button(QDialogButtonBox::Apply)->setEnabled(false);
}
