// SPDX-License-Identifier: GPL-2.0-or-later

#include "mergedispatcher.h"
#include "qpdfprovider.h"

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

// Write a PDF whose page i (0-based) is firstWidth + i points wide, so
// pages can be recognised after merging.
void writeTestPdf(const QString &path, int pages, int firstWidth)
{
    QPDF pdf;
    pdf.emptyPDF();
    QPDFPageDocumentHelper helper(pdf);
    for (int i = 0; i < pages; ++i) {
        const std::string dict = "<< /Type /Page /MediaBox [0 0 "
                                 + std::to_string(firstWidth + i)
                                 + " 792] /Resources << >> >>";
        QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::parse(dict));
        page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, std::string()));
        helper.addPage(QPDFPageObjectHelper(page), false);
    }
    QPDFWriter writer(pdf, QFile::encodeName(path).constData());
    writer.write();
}

QList<int> pageWidths(const QString &path)
{
    QPDF pdf;
    pdf.processFile(QFile::encodeName(path).constData());
    QList<int> widths;
    for (QPDFPageObjectHelper &page : QPDFPageDocumentHelper(pdf).getAllPages()) {
        QPDFObjectHandle box = page.getObjectHandle().getKey("/MediaBox");
        widths.append(static_cast<int>(box.getArrayItem(2).getNumericValue()));
    }
    return widths;
}

QByteArray readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    return file.readAll();
}

class QpdfProviderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        first = dir.filePath(QStringLiteral("first.pdf"));
        second = dir.filePath(QStringLiteral("second.pdf"));
        output = dir.filePath(QStringLiteral("merged.pdf"));
        writeTestPdf(first, 3, 100);
        writeTestPdf(second, 2, 200);
    }

    QTemporaryDir dir;
    QString first;
    QString second;
    QString output;
    QpdfProvider provider;
};

} // namespace

TEST_F(QpdfProviderTest, CountsPages)
{
    QString error;
    EXPECT_EQ(provider.pageCount(first, &error), 3);
    EXPECT_EQ(provider.pageCount(second, &error), 2);
    EXPECT_TRUE(error.isEmpty());
}

TEST_F(QpdfProviderTest, MissingFileHasNoPageCount)
{
    QString error;
    EXPECT_EQ(provider.pageCount(dir.filePath(QStringLiteral("nope.pdf")), &error), -1);
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(QpdfProviderTest, GarbageFileHasNoPageCount)
{
    const QString garbage = dir.filePath(QStringLiteral("garbage.pdf"));
    QFile file(garbage);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("this is not a pdf at all");
    file.close();

    QString error;
    EXPECT_EQ(provider.pageCount(garbage, &error), -1);
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(QpdfProviderTest, MergesPlannedPagesInOrder)
{
    MergePlan plan;
    plan.entries.append({first, {2, 3}});
    plan.entries.append({second, {1}});

    QList<QPair<int, int>> calls;
    QString error;
    ASSERT_TRUE(provider.merge(plan, output,
                               [&calls](int done, int total) { calls.append({done, total}); },
                               &error))
        << qPrintable(error);

    EXPECT_EQ(pageWidths(output), (QList<int>{101, 102, 200}));
    EXPECT_EQ(provider.pageCount(output, &error), 3);
    ASSERT_EQ(calls.size(), 2);
    EXPECT_EQ(calls.at(0), qMakePair(1, 2));
    EXPECT_EQ(calls.at(1), qMakePair(2, 2));
}

TEST_F(QpdfProviderTest, SameFileCanAppearTwice)
{
    MergePlan plan;
    plan.entries.append({second, {2}});
    plan.entries.append({second, {1, 2}});

    QString error;
    ASSERT_TRUE(provider.merge(plan, output, {}, &error)) << qPrintable(error);
    EXPECT_EQ(pageWidths(output), (QList<int>{201, 200, 201}));
}

TEST_F(QpdfProviderTest, MissingPageLeavesExistingOutputAlone)
{
    {
        QFile existing(output);
        ASSERT_TRUE(existing.open(QIODevice::WriteOnly));
        existing.write("keep me");
    }

    MergePlan plan;
    plan.entries.append({first, {1}});
    plan.entries.append({second, {5}});

    QString error;
    EXPECT_FALSE(provider.merge(plan, output, {}, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("second.pdf"))) << qPrintable(error);
    EXPECT_EQ(readAll(output), QByteArray("keep me"));
}

TEST_F(QpdfProviderTest, EmptyPlanIsRejected)
{
    QString error;
    EXPECT_FALSE(provider.merge(MergePlan(), output, {}, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(QFile::exists(output));
}

TEST_F(QpdfProviderTest, UnwritableOutputFails)
{
    MergePlan plan;
    plan.entries.append({first, {1}});

    QString error;
    EXPECT_FALSE(provider.merge(plan, dir.filePath(QStringLiteral("no/such/dir/out.pdf")),
                                {}, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(QpdfProviderTest, DispatcherMergesRealFiles)
{
    MergeDispatcher dispatcher(std::make_shared<QpdfProvider>());
    QSignalSpy finished(&dispatcher, &MergeDispatcher::finished);

    MergeRequest request;
    request.sources = {{first, QStringLiteral("-1")}, {second, QStringLiteral("all")}};
    request.outputPath = output;
    ASSERT_TRUE(dispatcher.submit(request));
    ASSERT_TRUE(finished.wait(10000));

    const MergeOutcome outcome = finished.at(0).at(0).value<MergeOutcome>();
    EXPECT_TRUE(outcome.success) << qPrintable(outcome.message);
    EXPECT_EQ(outcome.pageCount, 4);
    EXPECT_EQ(pageWidths(output), (QList<int>{101, 102, 200, 201}));
}
