/*
 * pageselection.cpp: Resolve per-file page selection expressions
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageselection.h"

#include <QObject>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <algorithm>
#include <limits>

namespace PageSelection {

namespace {

struct Span {
    int first = 0;
    int last = 0;
    bool exclude = false;
};

Result failure(Error error, const QString &token, const QString &message)
{
    Result result;
    result.valid = false;
    result.error = error;
    result.token = token;
    result.errorMessage = message;
    return result;
}

// Parse one page number; digits only, checked against [1, pageCount].
bool parsePage(const QString &digits, int pageCount, int &page)
{
    bool ok = false;
    const qlonglong value = digits.toLongLong(&ok);
    if (!ok || value < 1 || value > pageCount)
        return false;
    page = static_cast<int>(value);
    return true;
}

// Split an expression into spans. A negative pageCount leaves the upper
// bound unchecked.
Result parseSpans(const QString &trimmed, int pageCount, QList<Span> &spans,
                  bool &hasInclude)
{
    // Body of a token once the exclusion '-' has been stripped
    static const QRegularExpression tokenRe(
        QStringLiteral(R"(^(\d+)(?:\s*-\s*(\d+))?$)"));

    const int upper = pageCount < 0 ? std::numeric_limits<int>::max() : pageCount;

    const QStringList parts = trimmed.split(QLatin1Char(','));
    for (const QString &part : parts) {
        const QString token = part.trimmed();
        QString body = token;

        Span span;
        if (body.startsWith(QLatin1Char('-'))) {
            span.exclude = true;
            body = body.mid(1).trimmed();
        }

        const auto m = tokenRe.match(body);
        if (token.isEmpty() || !m.hasMatch()) {
            return failure(Error::InvalidToken, token,
                           QObject::tr("Invalid token \"%1\" in page selection \"%2\"")
                               .arg(token, trimmed));
        }

        const QString firstDigits = m.captured(1);
        const QString lastDigits = m.hasCaptured(2) ? m.captured(2) : firstDigits;

        // A reversed range is reported as such even when a bound is also
        // past the end of the document; numbers too large for 64 bits are
        // simply out of range.
        bool firstOk = false;
        bool lastOk = false;
        const qulonglong firstValue = firstDigits.toULongLong(&firstOk);
        const qulonglong lastValue = lastDigits.toULongLong(&lastOk);
        if (firstOk && lastOk && firstValue > lastValue) {
            return failure(Error::InvalidRange, token,
                           QObject::tr("Invalid range \"%1\" in page selection \"%2\": "
                                       "start page is after end page")
                               .arg(token, trimmed));
        }

        if (!parsePage(firstDigits, upper, span.first)
            || !parsePage(lastDigits, upper, span.last)) {
            if (pageCount < 0) {
                return failure(Error::OutOfRange, token,
                               QObject::tr("Page \"%1\" in page selection \"%2\" "
                                           "is not a valid page number")
                                   .arg(token, trimmed));
            }
            return failure(Error::OutOfRange, token,
                           QObject::tr("Page \"%1\" in page selection \"%2\" is outside "
                                       "the document (1-%3)")
                               .arg(token, trimmed)
                               .arg(pageCount));
        }

        if (!span.exclude)
            hasInclude = true;
        spans.append(span);
    }
    return Result();
}

} // namespace

bool selectsAll(const QString &expr)
{
    const QString t = expr.trimmed();
    return t.isEmpty() || t.compare(QLatin1String("all"), Qt::CaseInsensitive) == 0;
}

QString errorName(Error error)
{
    switch (error) {
    case Error::None:         return QStringLiteral("None");
    case Error::InvalidToken: return QStringLiteral("InvalidToken");
    case Error::OutOfRange:   return QStringLiteral("OutOfRange");
    case Error::InvalidRange: return QStringLiteral("InvalidRange");
    case Error::EmptyResult:  return QStringLiteral("EmptyResult");
    }
    return QString();
}

Result checkSyntax(const QString &expr)
{
    const QString trimmed = expr.trimmed();
    if (selectsAll(trimmed))
        return Result();

    QList<Span> spans;
    bool hasInclude = false;
    return parseSpans(trimmed, -1, spans, hasInclude);
}

Result resolve(const QString &expr, int pageCount)
{
    const QString trimmed = expr.trimmed();

    if (selectsAll(trimmed)) {
        if (pageCount < 1) {
            return failure(Error::EmptyResult, trimmed,
                           QObject::tr("Page selection \"%1\" selects no pages")
                               .arg(trimmed));
        }
        Result result;
        result.pages.reserve(pageCount);
        for (int i = 1; i <= pageCount; ++i)
            result.pages.append(i);
        return result;
    }

    QList<Span> spans;
    bool hasInclude = false;
    Result parsed = parseSpans(trimmed, qMax(pageCount, 0), spans, hasInclude);
    if (!parsed.valid)
        return parsed;

    QSet<int> selected;
    if (hasInclude) {
        for (const Span &span : std::as_const(spans)) {
            if (span.exclude)
                continue;
            for (int p = span.first; p <= span.last; ++p)
                selected.insert(p);
        }
    } else {
        for (int p = 1; p <= pageCount; ++p)
            selected.insert(p);
    }

    for (const Span &span : std::as_const(spans)) {
        if (!span.exclude)
            continue;
        for (int p = span.first; p <= span.last; ++p)
            selected.remove(p);
    }

    if (selected.isEmpty()) {
        return failure(Error::EmptyResult, trimmed,
                       QObject::tr("Page selection \"%1\" excludes every page")
                           .arg(trimmed));
    }

    Result result;
    result.pages = QList<int>(selected.cbegin(), selected.cend());
    std::sort(result.pages.begin(), result.pages.end());
    return result;
}

} // namespace PageSelection
