#ifndef PDFMERGER_MAINWINDOW_H
#define PDFMERGER_MAINWINDOW_H

#include <KXmlGuiWindow>

#include <memory>

#include "mergeplan.h"

class QAction;
class QCloseEvent;
class QLabel;
class QProgressBar;
class QPushButton;
class KMessageWidget;
class MergeDispatcher;
class MetadataStore;
class PdfFileListModel;
class PdfListView;
class QpdfProvider;

class MainWindow : public KXmlGuiWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    // Append PDFs to the list, skipping ones already there
    void addFiles(const QStringList &paths);
    void activateWithFiles(const QStringList &paths);

protected:
    void closeEvent(QCloseEvent *event) override;

private Q_SLOTS:
    void onAddFiles();
    void onRemoveSelected();
    void onClearAll();
    void onMoveUp();
    void onMoveDown();
    void onSortAlphabetically();
    void onSortNumerically();
    void onReorderToggled(bool enabled);
    void onMerge();
    void onMergeProgress(int percent);
    void onMergeFinished(const MergeOutcome &outcome);
    void showPreferences();
    void onSettingsChanged();

private:
    void setupActions();
    void updateActions();
    void setMergeRunning(bool running);
    bool confirmMergeOrder();
    void rememberSelections();
    void showStatus(const QString &text);
    int currentRow() const;
    void saveSession();
    void restoreSession();

    PdfFileListModel *m_model = nullptr;
    PdfListView *m_listView = nullptr;
    QProgressBar *m_progressBar = nullptr;
    QPushButton *m_mergeButton = nullptr;
    QLabel *m_statusLabel = nullptr;
    KMessageWidget *m_messageWidget = nullptr;

    QAction *m_addAction = nullptr;
    QAction *m_removeAction = nullptr;
    QAction *m_clearAction = nullptr;
    QAction *m_moveUpAction = nullptr;
    QAction *m_moveDownAction = nullptr;
    QAction *m_sortAlphaAction = nullptr;
    QAction *m_sortNumAction = nullptr;
    QAction *m_reorderAction = nullptr;
    QAction *m_mergeAction = nullptr;

    std::shared_ptr<QpdfProvider> m_provider;
    MergeDispatcher *m_dispatcher = nullptr;
    MetadataStore *m_metadataStore = nullptr;

    bool m_merging = false;
    QString m_lastInputDir;
    QString m_lastOutputDir;
};

#endif // PDFMERGER_MAINWINDOW_H
