#ifndef PDFMERGER_METADATASTORE_H
#define PDFMERGER_METADATASTORE_H

#include <QJsonObject>
#include <QObject>
#include <QString>

// Remembers the page selection last used for each input file.
// Entries are tied to the file's size and modification time, so a file
// replaced under the same name starts from the default selection again.
class MetadataStore : public QObject
{
    Q_OBJECT

public:
    explicit MetadataStore(QObject *parent = nullptr);
    // Store under a fixed directory instead of the app data location
    explicit MetadataStore(const QString &storageDir, QObject *parent = nullptr);

    // Empty if nothing is stored or the file changed since it was stored
    QString selection(const QString &filePath) const;
    bool setSelection(const QString &filePath, const QString &expr);
    void remove(const QString &filePath);

    // Raw per-file record
    QJsonObject load(const QString &filePath) const;
    bool save(const QString &filePath, const QJsonObject &metadata);

private:
    QString metadataDir() const;
    QString metadataFilePath(const QString &filePath) const;
    QString hashPath(const QString &filePath) const;
    static QString fileStamp(const QString &filePath);

    QString m_storageDir;
};

#endif // PDFMERGER_METADATASTORE_H
