#include "mainwindow.h"

#include <KActionCollection>
#include <KConfigGroup>
#include <KLocalizedString>
#include <KMessageWidget>
#include <KSharedConfig>
#include <KStandardAction>
#include <KToolBar>

#include "mergedispatcher.h"
#include "metadatastore.h"
#include "pageselectiondialog.h"
#include "pdffilelistmodel.h"
#include "pdflistview.h"
#include "pdfmergersettings.h"
#include "preferencesdialog.h"
#include "qpdfprovider.h"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QLabel>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QStatusBar>
#include <QToolButton>
#include <QVBoxLayout>

#include <algorithm>
#include <functional>

MainWindow::MainWindow(QWidget *parent)
    : KXmlGuiWindow(parent)
    , m_provider(std::make_shared<QpdfProvider>())
{
    // Owned by main() on the stack
    setAttribute(Qt::WA_DeleteOnClose, false);

    m_model = new PdfFileListModel(this);
    m_model->setDefaultSelection(PdfMergerSettings::self()->defaultSelection());
    m_dispatcher = new MergeDispatcher(m_provider, this);
    m_metadataStore = new MetadataStore(this);

    connect(m_dispatcher, &MergeDispatcher::progressChanged,
            this, &MainWindow::onMergeProgress);
    connect(m_dispatcher, &MergeDispatcher::finished,
            this, &MainWindow::onMergeFinished);

    setupActions();

    auto *central = new QWidget(this);
    auto *layout = new QVBoxLayout(central);

    m_messageWidget = new KMessageWidget(central);
    m_messageWidget->setCloseButtonVisible(true);
    m_messageWidget->setWordWrap(true);
    m_messageWidget->hide();
    layout->addWidget(m_messageWidget);

    auto *listRow = new QHBoxLayout;

    m_listView = new PdfListView(central);
    m_listView->setModel(m_model);
    listRow->addWidget(m_listView, 1);

    // Buttons mirror the actions so their enabled state follows them
    auto *buttonColumn = new QVBoxLayout;
    const QList<QAction *> buttonActions = {
        m_addAction, m_removeAction, m_clearAction, m_moveUpAction,
        m_moveDownAction, m_sortAlphaAction, m_sortNumAction, m_reorderAction,
    };
    for (QAction *action : buttonActions) {
        auto *button = new QToolButton(central);
        button->setDefaultAction(action);
        button->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
        button->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
        buttonColumn->addWidget(button);
    }
    buttonColumn->addStretch();
    listRow->addLayout(buttonColumn);
    layout->addLayout(listRow, 1);

    m_progressBar = new QProgressBar(central);
    m_progressBar->setRange(0, 100);
    m_progressBar->setValue(0);
    layout->addWidget(m_progressBar);

    m_mergeButton = new QPushButton(m_mergeAction->icon(), m_mergeAction->text(), central);
    m_mergeButton->setMinimumHeight(40);
    connect(m_mergeButton, &QPushButton::clicked, m_mergeAction, &QAction::trigger);
    connect(m_mergeAction, &QAction::changed, this, [this]() {
        m_mergeButton->setEnabled(m_mergeAction->isEnabled());
    });
    layout->addWidget(m_mergeButton);

    m_statusLabel = new QLabel(i18n("Ready"), central);
    layout->addWidget(m_statusLabel);

    setCentralWidget(central);

    connect(m_listView, &PdfListView::filesDropped, this, &MainWindow::addFiles);
    connect(m_listView->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, &MainWindow::updateActions);
    connect(m_model, &QAbstractItemModel::rowsInserted, this, &MainWindow::updateActions);
    connect(m_model, &QAbstractItemModel::rowsRemoved, this, &MainWindow::updateActions);
    connect(m_model, &QAbstractItemModel::modelReset, this, &MainWindow::updateActions);
    connect(m_model, &QAbstractItemModel::rowsMoved, this, [this]() {
        showStatus(i18n("File order updated"));
    });

    setMinimumSize(600, 400);
    resize(800, 600);

    restoreSession();
    updateActions();
}

MainWindow::~MainWindow() = default;

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_merging) {
        const auto answer = QMessageBox::question(
            this, i18n("Merge in Progress"),
            i18n("A merge is still running. Quit after it finishes?"),
            QMessageBox::Yes | QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
    }

    rememberSelections();
    saveSession();
    KXmlGuiWindow::closeEvent(event);
}

void MainWindow::setupActions()
{
    KActionCollection *ac = actionCollection();

    KStandardAction::quit(qApp, &QApplication::quit, ac);
    KStandardAction::preferences(this, &MainWindow::showPreferences, ac);

    m_addAction = ac->addAction(QStringLiteral("file_add_pdfs"));
    m_addAction->setText(i18n("&Add PDFs..."));
    m_addAction->setIcon(QIcon::fromTheme(QStringLiteral("list-add")));
    ac->setDefaultShortcut(m_addAction, QKeySequence::Open);
    connect(m_addAction, &QAction::triggered, this, &MainWindow::onAddFiles);

    m_removeAction = ac->addAction(QStringLiteral("edit_remove_selected"));
    m_removeAction->setText(i18n("&Remove Selected"));
    m_removeAction->setIcon(QIcon::fromTheme(QStringLiteral("list-remove")));
    ac->setDefaultShortcut(m_removeAction, QKeySequence::Delete);
    connect(m_removeAction, &QAction::triggered, this, &MainWindow::onRemoveSelected);

    m_clearAction = ac->addAction(QStringLiteral("edit_clear_all"));
    m_clearAction->setText(i18n("&Clear All"));
    m_clearAction->setIcon(QIcon::fromTheme(QStringLiteral("edit-clear-all")));
    connect(m_clearAction, &QAction::triggered, this, &MainWindow::onClearAll);

    m_moveUpAction = ac->addAction(QStringLiteral("edit_move_up"));
    m_moveUpAction->setText(i18n("Move &Up"));
    m_moveUpAction->setIcon(QIcon::fromTheme(QStringLiteral("go-up")));
    ac->setDefaultShortcut(m_moveUpAction, QKeySequence(Qt::CTRL | Qt::Key_Up));
    connect(m_moveUpAction, &QAction::triggered, this, &MainWindow::onMoveUp);

    m_moveDownAction = ac->addAction(QStringLiteral("edit_move_down"));
    m_moveDownAction->setText(i18n("Move &Down"));
    m_moveDownAction->setIcon(QIcon::fromTheme(QStringLiteral("go-down")));
    ac->setDefaultShortcut(m_moveDownAction, QKeySequence(Qt::CTRL | Qt::Key_Down));
    connect(m_moveDownAction, &QAction::triggered, this, &MainWindow::onMoveDown);

    m_sortAlphaAction = ac->addAction(QStringLiteral("edit_sort_alpha"));
    m_sortAlphaAction->setText(i18n("Sort &Alphabetically"));
    m_sortAlphaAction->setIcon(QIcon::fromTheme(QStringLiteral("view-sort-ascending-name")));
    connect(m_sortAlphaAction, &QAction::triggered, this, &MainWindow::onSortAlphabetically);

    m_sortNumAction = ac->addAction(QStringLiteral("edit_sort_numeric"));
    m_sortNumAction->setText(i18n("Sort &Numerically"));
    m_sortNumAction->setIcon(QIcon::fromTheme(QStringLiteral("view-sort-ascending")));
    connect(m_sortNumAction, &QAction::triggered, this, &MainWindow::onSortNumerically);

    m_reorderAction = ac->addAction(QStringLiteral("edit_drag_reorder"));
    m_reorderAction->setText(i18n("Drag && Drop &Ordering"));
    m_reorderAction->setIcon(QIcon::fromTheme(QStringLiteral("transform-move")));
    m_reorderAction->setCheckable(true);
    connect(m_reorderAction, &QAction::toggled, this, &MainWindow::onReorderToggled);

    m_mergeAction = ac->addAction(QStringLiteral("file_merge"));
    m_mergeAction->setText(i18n("&Merge PDFs..."));
    m_mergeAction->setIcon(QIcon::fromTheme(QStringLiteral("document-save")));
    ac->setDefaultShortcut(m_mergeAction, QKeySequence(Qt::CTRL | Qt::Key_M));
    connect(m_mergeAction, &QAction::triggered, this, &MainWindow::onMerge);

    setupGUI(Default, QStringLiteral("pdfmergerui.rc"));

    toolBar()->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
}

void MainWindow::updateActions()
{
    const bool hasFiles = m_model->rowCount() > 0;
    const bool hasSelection = m_listView
        && m_listView->selectionModel()
        && m_listView->selectionModel()->hasSelection();
    const bool idle = !m_merging;
    const bool ordering = idle && !m_reorderAction->isChecked();

    m_addAction->setEnabled(idle);
    m_removeAction->setEnabled(idle && hasSelection);
    m_clearAction->setEnabled(idle && hasFiles);
    m_moveUpAction->setEnabled(ordering && hasSelection);
    m_moveDownAction->setEnabled(ordering && hasSelection);
    m_sortAlphaAction->setEnabled(ordering && hasFiles);
    m_sortNumAction->setEnabled(ordering && hasFiles);
    m_reorderAction->setEnabled(idle);
    m_mergeAction->setEnabled(idle && hasFiles);
    if (m_listView)
        m_listView->setEnabled(idle);
}

void MainWindow::setMergeRunning(bool running)
{
    m_merging = running;
    updateActions();
}

void MainWindow::showStatus(const QString &text)
{
    m_statusLabel->setText(text);
}

int MainWindow::currentRow() const
{
    const QModelIndex index = m_listView->currentIndex();
    if (index.isValid() && m_listView->selectionModel()->isSelected(index))
        return index.row();
    const QModelIndexList selected = m_listView->selectionModel()->selectedRows();
    return selected.isEmpty() ? -1 : selected.first().row();
}

void MainWindow::addFiles(const QStringList &paths)
{
    const int firstNew = m_model->rowCount();
    const int added = m_model->addFiles(paths);

    if (PdfMergerSettings::self()->rememberSelections()) {
        for (int row = firstNew; row < firstNew + added; ++row) {
            const QString remembered = m_metadataStore->selection(m_model->filePath(row));
            if (!remembered.isEmpty())
                m_model->setSelection(row, remembered);
        }
    }

    if (added > 0)
        m_lastInputDir = QFileInfo(m_model->filePath(firstNew)).absolutePath();

    m_messageWidget->animatedHide();
    showStatus(i18np("%1 PDF selected", "%1 PDFs selected", m_model->rowCount()));
}

void MainWindow::activateWithFiles(const QStringList &paths)
{
    addFiles(paths);
    raise();
    activateWindow();
}

void MainWindow::onAddFiles()
{
    const QString startDir = m_lastInputDir.isEmpty() ? QDir::homePath() : m_lastInputDir;
    const QStringList files = QFileDialog::getOpenFileNames(
        this,
        i18n("Select PDF Files"),
        startDir,
        i18n("PDF Files (*.pdf)"));

    if (!files.isEmpty())
        addFiles(files);
}

void MainWindow::onRemoveSelected()
{
    QList<int> rows;
    const QModelIndexList selected = m_listView->selectionModel()->selectedRows();
    for (const QModelIndex &index : selected)
        rows.append(index.row());

    // Bottom to top so earlier rows keep their index
    std::sort(rows.begin(), rows.end(), std::greater<int>());
    for (int row : std::as_const(rows))
        m_model->removeRows(row, 1);

    showStatus(i18np("%1 PDF selected", "%1 PDFs selected", m_model->rowCount()));
}

void MainWindow::onClearAll()
{
    m_model->clear();
    showStatus(i18n("All files cleared"));
}

void MainWindow::onMoveUp()
{
    const int row = currentRow();
    if (row < 0 || !m_model->moveUp(row))
        return;
    m_listView->setCurrentIndex(m_model->index(row - 1));
}

void MainWindow::onMoveDown()
{
    const int row = currentRow();
    if (row < 0 || !m_model->moveDown(row))
        return;
    m_listView->setCurrentIndex(m_model->index(row + 1));
}

void MainWindow::onSortAlphabetically()
{
    m_model->sortAlphabetically();
    showStatus(i18n("Files sorted alphabetically"));
}

void MainWindow::onSortNumerically()
{
    m_model->sortNumerically();
    showStatus(i18n("Files sorted numerically"));
}

void MainWindow::onReorderToggled(bool enabled)
{
    m_model->setReorderEnabled(enabled);
    m_listView->setReorderEnabled(enabled);
    m_reorderAction->setText(enabled ? i18n("Disable Drag && Drop")
                                     : i18n("Drag && Drop &Ordering"));
    showStatus(enabled ? i18n("Drag and drop enabled - reorder files by dragging")
                       : i18n("Drag and drop disabled - use the buttons to reorder"));
    updateActions();
}

bool MainWindow::confirmMergeOrder()
{
    QStringList lines;
    for (int row = 0; row < m_model->rowCount(); ++row) {
        QString expr = m_model->selection(row);
        if (expr.trimmed().isEmpty())
            expr = i18n("all");
        lines << i18n("%1. %2 - Pages: %3", row + 1,
                      QFileInfo(m_model->filePath(row)).fileName(), expr);
    }

    const auto answer = QMessageBox::question(
        this,
        i18n("Confirm Order and Page Selection"),
        i18n("Files will be merged in this order with the selected pages:\n\n%1\n\nProceed?",
             lines.join(QLatin1Char('\n'))),
        QMessageBox::Yes | QMessageBox::No);
    return answer == QMessageBox::Yes;
}

void MainWindow::onMerge()
{
    if (m_model->rowCount() == 0) {
        QMessageBox::warning(this, i18n("Warning"), i18n("No PDF files selected."));
        return;
    }

    PageSelectionDialog selectionDialog(m_model, m_provider.get(), this);
    if (selectionDialog.exec() != QDialog::Accepted)
        return;
    selectionDialog.applySelections();
    rememberSelections();

    if (PdfMergerSettings::self()->confirmBeforeMerge() && !confirmMergeOrder())
        return;

    const QString startDir = m_lastOutputDir.isEmpty() ? m_lastInputDir : m_lastOutputDir;
    QString outputPath = QFileDialog::getSaveFileName(
        this,
        i18n("Save Merged PDF"),
        startDir,
        i18n("PDF Files (*.pdf)"));
    if (outputPath.isEmpty())
        return;

    if (!outputPath.endsWith(QLatin1String(".pdf"), Qt::CaseInsensitive))
        outputPath += QStringLiteral(".pdf");
    m_lastOutputDir = QFileInfo(outputPath).absolutePath();

    if (!m_dispatcher->submit(m_model->mergeRequest(outputPath))) {
        QMessageBox::warning(this, i18n("Merge Busy"),
                             i18n("%1 is already being written.", outputPath));
        return;
    }

    m_messageWidget->animatedHide();
    m_progressBar->setValue(0);
    setMergeRunning(true);
    showStatus(i18n("Merging PDFs..."));
}

void MainWindow::onMergeProgress(int percent)
{
    m_progressBar->setValue(percent);
}

void MainWindow::onMergeFinished(const MergeOutcome &outcome)
{
    setMergeRunning(m_dispatcher->isBusy());

    if (outcome.success) {
        m_messageWidget->setMessageType(KMessageWidget::Positive);
        m_messageWidget->setText(outcome.message);
        m_messageWidget->animatedShow();
        QMessageBox::information(this, i18n("Success"), outcome.message);
        showStatus(i18n("Merge completed successfully"));
    } else {
        m_progressBar->setValue(0);
        m_messageWidget->setMessageType(KMessageWidget::Error);
        m_messageWidget->setText(outcome.message);
        m_messageWidget->animatedShow();
        QMessageBox::critical(this, i18n("Error"), outcome.message);
        showStatus(i18n("Merge failed"));
    }
}

void MainWindow::rememberSelections()
{
    if (!PdfMergerSettings::self()->rememberSelections())
        return;

    for (int row = 0; row < m_model->rowCount(); ++row) {
        const QString path = m_model->filePath(row);
        QString expr = m_model->selection(row).trimmed();
        // An empty record reads back as "nothing stored"
        if (expr.isEmpty())
            expr = QStringLiteral("all");
        if (!m_metadataStore->setSelection(path, expr))
            qWarning() << "MainWindow: could not remember selection for" << path;
    }
}

void MainWindow::showPreferences()
{
    if (KConfigDialog::showDialog(QStringLiteral("settings")))
        return;

    auto *dialog = new PdfMergerConfigDialog(this);
    connect(dialog, &KConfigDialog::settingsChanged,
            this, &MainWindow::onSettingsChanged);
    dialog->show();
}

void MainWindow::onSettingsChanged()
{
    m_model->setDefaultSelection(PdfMergerSettings::self()->defaultSelection());
}

void MainWindow::saveSession()
{
    KConfigGroup group(KSharedConfig::openConfig(),
                       QStringLiteral("Session"));
    group.writeEntry("LastInputDir", m_lastInputDir);
    group.writeEntry("LastOutputDir", m_lastOutputDir);
    group.writeEntry("DragDropOrdering", m_reorderAction->isChecked());
    group.sync();
}

void MainWindow::restoreSession()
{
    KConfigGroup group(KSharedConfig::openConfig(),
                       QStringLiteral("Session"));
    m_lastInputDir = group.readEntry("LastInputDir", QString());
    m_lastOutputDir = group.readEntry("LastOutputDir", QString());
    m_reorderAction->setChecked(group.readEntry("DragDropOrdering", false));
}
