#include "metadatastore.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QStandardPaths>

namespace {
const QString s_selectionKey = QStringLiteral("selection");
const QString s_stampKey = QStringLiteral("_stamp");
const QString s_pathKey = QStringLiteral("_filePath");
}

MetadataStore::MetadataStore(QObject *parent)
    : QObject(parent)
{
}

MetadataStore::MetadataStore(const QString &storageDir, QObject *parent)
    : QObject(parent)
    , m_storageDir(storageDir)
{
}

QString MetadataStore::metadataDir() const
{
    QString dir = m_storageDir;
    if (dir.isEmpty()) {
        dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
              + QStringLiteral("/selections");
    }
    QDir().mkpath(dir);
    return dir;
}

QString MetadataStore::hashPath(const QString &filePath) const
{
    QByteArray hash = QCryptographicHash::hash(
        QFileInfo(filePath).absoluteFilePath().toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex().left(16));
}

QString MetadataStore::metadataFilePath(const QString &filePath) const
{
    return metadataDir() + QLatin1Char('/') + hashPath(filePath)
           + QStringLiteral(".json");
}

// Size and mtime of the file; changes whenever the PDF is rewritten
QString MetadataStore::fileStamp(const QString &filePath)
{
    QFileInfo fi(filePath);
    if (!fi.exists())
        return QString();
    return QStringLiteral("%1:%2").arg(fi.size())
        .arg(fi.lastModified().toMSecsSinceEpoch());
}

QJsonObject MetadataStore::load(const QString &filePath) const
{
    QFile file(metadataFilePath(filePath));
    if (!file.open(QIODevice::ReadOnly))
        return {};

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "MetadataStore: ignoring corrupt record for" << filePath
                   << error.errorString();
        return {};
    }
    return doc.object();
}

bool MetadataStore::save(const QString &filePath, const QJsonObject &metadata)
{
    QFile file(metadataFilePath(filePath));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "MetadataStore: cannot write" << file.fileName()
                   << file.errorString();
        return false;
    }

    QJsonObject obj = metadata;
    obj[s_pathKey] = QFileInfo(filePath).absoluteFilePath();

    file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    return true;
}

void MetadataStore::remove(const QString &filePath)
{
    QFile::remove(metadataFilePath(filePath));
}

QString MetadataStore::selection(const QString &filePath) const
{
    const QJsonObject obj = load(filePath);
    if (!obj.contains(s_selectionKey))
        return QString();
    if (obj.value(s_stampKey).toString() != fileStamp(filePath))
        return QString();
    return obj.value(s_selectionKey).toString();
}

bool MetadataStore::setSelection(const QString &filePath, const QString &expr)
{
    QJsonObject obj = load(filePath);
    obj[s_selectionKey] = expr;
    obj[s_stampKey] = fileStamp(filePath);
    return save(filePath, obj);
}
