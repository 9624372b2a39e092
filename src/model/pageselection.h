/*
 * pageselection.h: Resolve per-file page selection expressions
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PDFMERGER_PAGESELECTION_H
#define PDFMERGER_PAGESELECTION_H

#include <QList>
#include <QString>

namespace PageSelection {

enum class Error {
    None,
    InvalidToken,   // token matches none of N, N-M, -N, -N-M
    OutOfRange,     // page number outside [1, pageCount]
    InvalidRange,   // N-M with N > M
    EmptyResult,    // includes and excludes cancel out
};

struct Result {
    QList<int> pages;       // 1-based, distinct, ascending
    bool valid = true;
    Error error = Error::None;
    QString token;          // offending token, empty unless invalid
    QString errorMessage;   // non-empty if invalid
};

// Resolve an expression like "1,3,5-7", "-1,-3" or "-1-3" against a
// document of pageCount pages. Empty or "all" selects every page.
// A leading '-' always marks exclusion, so "-1-3" excludes pages 1 to 3.
// Includes form the candidate set (all pages when there are none) and
// excludes are removed from it.
Result resolve(const QString &expr, int pageCount);

// Check the syntax of an expression without a document: every token must
// be well formed, every range ascending and every page at least 1.
// EmptyResult is never reported and pages is left empty.
Result checkSyntax(const QString &expr);

// True for the expressions that select every page ("" and "all").
bool selectsAll(const QString &expr);

// Short label for an error kind, e.g. "InvalidRange".
QString errorName(Error error);

} // namespace PageSelection

#endif // PDFMERGER_PAGESELECTION_H
