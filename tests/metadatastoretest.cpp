// SPDX-License-Identifier: GPL-2.0-or-later

#include "metadatastore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <gtest/gtest.h>

namespace {

bool writeFile(const QString &path, const QByteArray &contents)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    return file.write(contents) == contents.size();
}

class MetadataStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        pdfPath = dir.filePath(QStringLiteral("input.pdf"));
        ASSERT_TRUE(writeFile(pdfPath, "%PDF-1.4 placeholder"));
    }

    QString storeDir() const { return dir.filePath(QStringLiteral("store")); }

    QTemporaryDir dir;
    QString pdfPath;
};

} // namespace

TEST_F(MetadataStoreTest, RemembersSelection)
{
    MetadataStore store(storeDir());
    EXPECT_TRUE(store.selection(pdfPath).isEmpty());

    ASSERT_TRUE(store.setSelection(pdfPath, QStringLiteral("2-5")));
    EXPECT_EQ(store.selection(pdfPath), QStringLiteral("2-5"));

    // A second store over the same directory sees the record
    MetadataStore other(storeDir());
    EXPECT_EQ(other.selection(pdfPath), QStringLiteral("2-5"));
}

TEST_F(MetadataStoreTest, ChangedFileForgetsSelection)
{
    MetadataStore store(storeDir());
    ASSERT_TRUE(store.setSelection(pdfPath, QStringLiteral("1")));

    ASSERT_TRUE(writeFile(pdfPath, "%PDF-1.4 a different and longer placeholder"));
    EXPECT_TRUE(store.selection(pdfPath).isEmpty());
}

TEST_F(MetadataStoreTest, RemoveDropsRecord)
{
    MetadataStore store(storeDir());
    ASSERT_TRUE(store.setSelection(pdfPath, QStringLiteral("3")));
    store.remove(pdfPath);
    EXPECT_TRUE(store.selection(pdfPath).isEmpty());
    EXPECT_TRUE(store.load(pdfPath).isEmpty());
}

TEST_F(MetadataStoreTest, CorruptRecordIsIgnored)
{
    MetadataStore store(storeDir());
    ASSERT_TRUE(store.setSelection(pdfPath, QStringLiteral("3")));

    const QStringList records = QDir(storeDir()).entryList({QStringLiteral("*.json")}, QDir::Files);
    ASSERT_EQ(records.size(), 1);
    ASSERT_TRUE(writeFile(QDir(storeDir()).filePath(records.first()), "{ not json"));

    EXPECT_TRUE(store.selection(pdfPath).isEmpty());
}

TEST_F(MetadataStoreTest, RecordsAreKeptPerFile)
{
    const QString secondPath = dir.filePath(QStringLiteral("second.pdf"));
    ASSERT_TRUE(writeFile(secondPath, "%PDF-1.4 second"));

    MetadataStore store(storeDir());
    ASSERT_TRUE(store.setSelection(pdfPath, QStringLiteral("1")));
    ASSERT_TRUE(store.setSelection(secondPath, QStringLiteral("-2")));

    EXPECT_EQ(store.selection(pdfPath), QStringLiteral("1"));
    EXPECT_EQ(store.selection(secondPath), QStringLiteral("-2"));
    EXPECT_EQ(store.load(secondPath).value(QStringLiteral("_filePath")).toString(),
              QFileInfo(secondPath).absoluteFilePath());
}
