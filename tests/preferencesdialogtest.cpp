// SPDX-License-Identifier: GPL-2.0-or-later

#include "preferencesdialog.h"

#include <QDialogButtonBox>
#include <QLineEdit>
#include <QPushButton>

#include <gtest/gtest.h>

TEST(PreferencesDialogTest, InvalidDefaultSelectionCannotBeSaved)
{
    PdfMergerConfigDialog dialog(nullptr);

    auto *edit = dialog.findChild<QLineEdit *>(QStringLiteral("kcfg_DefaultSelection"));
    ASSERT_NE(edit, nullptr);
    auto *buttons = dialog.findChild<QDialogButtonBox *>();
    ASSERT_NE(buttons, nullptr);
    QPushButton *ok = buttons->button(QDialogButtonBox::Ok);
    QPushButton *apply = buttons->button(QDialogButtonBox::Apply);
    ASSERT_NE(ok, nullptr);
    ASSERT_NE(apply, nullptr);

    EXPECT_TRUE(ok->isEnabled());

    edit->setText(QStringLiteral("1-3,abc"));
    EXPECT_FALSE(ok->isEnabled());
    EXPECT_FALSE(apply->isEnabled());

    edit->setText(QStringLiteral("5-2"));
    EXPECT_FALSE(ok->isEnabled());

    edit->setText(QStringLiteral("2-4"));
    EXPECT_TRUE(ok->isEnabled());
}
