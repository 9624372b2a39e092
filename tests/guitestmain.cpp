// SPDX-License-Identifier: GPL-2.0-or-later

#include <QApplication>
#include <QStandardPaths>

#include <gtest/gtest.h>

// Widget tests run against a private config and data location so the
// user's settings and session stay untouched.
int main(int argc, char **argv)
{
    QStandardPaths::setTestModeEnabled(true);
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("pdfmergerguitests"));
    QApplication::setQuitOnLastWindowClosed(false);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
