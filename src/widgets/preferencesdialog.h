#ifndef PDFMERGER_PREFERENCESDIALOG_H
#define PDFMERGER_PREFERENCESDIALOG_H

#include <KConfigDialog>

class QLineEdit;

class PdfMergerConfigDialog : public KConfigDialog
{
    Q_OBJECT

public:
    explicit PdfMergerConfigDialog(QWidget *parent);

private:
    void validateDefaultSelection();

    QLineEdit *m_defaultSelectionEdit;
};

#endif // PDFMERGER_PREFERENCESDIALOG_H
