/**************************************************************************
**
** Copyright (C) 2024 The Qt Company Ltd.
** Contact: https://www.qt.io/licensing/
**
** This file is part of the Qt Installer Framework.
**
** $QT_BEGIN_LICENSE:GPL-EXCEPT$
** Commercial License Usage
** Licensees holding valid commercial Qt licenses may use this file in
** accordance with the commercial license agreement provided with the
** Software or, alternatively, in accordance with the terms contained in
** a written agreement between you and The Qt Company. For licensing terms
** and conditions see https://www.qt.io/terms-conditions. For further
** information use the contact form at https://www.qt.io/contact-us.
**
** GNU General Public License Usage
** Alternatively, this file may be used under the terms of the GNU
** General Public License version 3 as published by the Free Software
** Foundation with exceptions as appearing in the file LICENSE.GPL3-EXCEPT
** included in the packaging of this file. Please review the following
** information to ensure the GNU General Public License requirements will
** be met: https://www.gnu.org/licenses/gpl-3.0.html.
**
** $QT_END_LICENSE$
**
**************************************************************************/

#include "layoutbudget.h"

#include "globals.h"
#include "onboardingdata.h"

#include <QFontDatabase>
#include <QFontMetricsF>
#include <QTextDocument>

#include <limits>

namespace Onboarding {

/*!
    \class Onboarding::LayoutBudgetAllocator
    \brief The LayoutBudgetAllocator class distributes the height of a page
    container among the title, subtitle, body text and media of a page.

    Content blocks are consumed in a fixed order. Each block is measured with the
    ContentMetrics given at construction, recorded with its target LayoutRegion and
    subtracted from a running budget that starts at the container height.

    Pages with media put the body into the center region, sized against what is
    left after title and subtitle, and the media into the bottom region, sized
    against what is left after the body. Pages without media stack the body below
    title and subtitle in the top region.

    The budget is never clamped. A negative remainder means the content overflows
    the container, which is left to the view.
*/

bool LayoutInsertion::operator==(const LayoutInsertion &other) const
{
    return region == other.region && index == other.index && kind == other.kind
        && requestedSize == other.requestedSize
        && qFuzzyCompare(measuredHeight + 1, other.measuredHeight + 1)
        && qFuzzyCompare(remainingAfter + 1, other.remainingAfter + 1);
}

/*!
    Returns the insertions recorded for \a region, in insertion order.
*/
QList<LayoutInsertion> LayoutPlan::insertionsIn(LayoutRegion region) const
{
    QList<LayoutInsertion> result;
    for (const LayoutInsertion &insertion : insertions) {
        if (insertion.region == region)
            result.append(insertion);
    }
    return result;
}

/*!
    Returns \c true if an element of \a kind was inserted.
*/
bool LayoutPlan::contains(ElementKind kind) const
{
    for (const LayoutInsertion &insertion : insertions) {
        if (insertion.kind == kind)
            return true;
    }
    return false;
}

bool LayoutPlan::operator==(const LayoutPlan &other) const
{
    return insertions == other.insertions && qFuzzyCompare(remaining + 1, other.remaining + 1);
}

// -- FontContentMetrics

FontContentMetrics::FontContentMetrics()
    : FontContentMetrics(defaultTitleFont(), defaultSubtitleFont(),
          QFontDatabase::systemFont(QFontDatabase::GeneralFont))
{
}

FontContentMetrics::FontContentMetrics(const QFont &titleFont, const QFont &subtitleFont,
        const QFont &bodyFont)
    : m_titleFont(titleFont)
    , m_subtitleFont(subtitleFont)
    , m_bodyFont(bodyFont)
{
}

QFont FontContentMetrics::defaultTitleFont()
{
    QFont font = QFontDatabase::systemFont(QFontDatabase::TitleFont);
    font.setPointSize(26);
    font.setBold(true);
    return font;
}

QFont FontContentMetrics::defaultSubtitleFont()
{
    QFont font = QFontDatabase::systemFont(QFontDatabase::GeneralFont);
    font.setPointSize(16);
    font.setWeight(QFont::DemiBold);
    return font;
}

static qreal wrappedTextHeight(const QFont &font, const QString &text, qreal width)
{
    const QFontMetricsF metrics(font);
    const QRectF bounds(0, 0, qMax<qreal>(width, 1), std::numeric_limits<int>::max());
    return metrics.boundingRect(bounds, Qt::TextWordWrap | Qt::AlignHCenter, text).height();
}

qreal FontContentMetrics::titleHeight(const QString &text, qreal width) const
{
    return wrappedTextHeight(m_titleFont, text, width);
}

qreal FontContentMetrics::subtitleHeight(const QString &text, qreal width) const
{
    return wrappedTextHeight(m_subtitleFont, text, width);
}

/*!
    Returns the height the body view takes for \a markdown: the laid out document
    height, bounded by the height of \a bounds.
*/
qreal FontContentMetrics::bodyHeight(const QString &markdown, const QSizeF &bounds) const
{
    QTextDocument document;
    document.setDefaultFont(m_bodyFont);
    document.setMarkdown(markdown);
    document.setTextWidth(qMax<qreal>(bounds.width(), 1));
    return qBound<qreal>(0, document.size().height(), qMax<qreal>(bounds.height(), 0));
}

// -- LayoutBudgetAllocator

/*!
    Constructs an allocator that measures content with \a metrics and keeps
    \a spacing between consecutive elements. \a metrics must outlive the allocator.
*/
LayoutBudgetAllocator::LayoutBudgetAllocator(const ContentMetrics &metrics, qreal spacing)
    : m_metrics(metrics)
    , m_spacing(spacing)
{
}

/*!
    Returns the insertion plan for \a page inside a container of size \a container.
    The function has no side effects; identical input gives an identical plan.
*/
LayoutPlan LayoutBudgetAllocator::allocate(const QSizeF &container, const OnboardingPage &page) const
{
    LayoutPlan plan;
    const qreal width = container.width();
    qreal remaining = container.height();
    int topIndex = 0;

    if (page.title) {
        const qreal height = m_metrics.titleHeight(*page.title, width);
        remaining -= height + m_spacing;
        plan.insertions.append(LayoutInsertion{ LayoutRegion::Top, topIndex++, ElementKind::Title,
                                 QSizeF(width, height), height, remaining });
    }
    if (page.subtitle) {
        const qreal height = m_metrics.subtitleHeight(*page.subtitle, width);
        remaining -= height + m_spacing;
        plan.insertions.append(LayoutInsertion{ LayoutRegion::Top, topIndex++, ElementKind::Subtitle,
                                 QSizeF(width, height), height, remaining });
    }

    if (page.media) {
        // media pages keep the body next to the media as a caption
        if (page.body) {
            const QSizeF bounds(width, remaining);
            const qreal height = m_metrics.bodyHeight(*page.body, bounds);
            remaining -= height + m_spacing;
            plan.insertions.append(LayoutInsertion{ LayoutRegion::Center, 0, ElementKind::Body,
                                     bounds, height, remaining });
        }
        if (page.media->hasPayload()) {
            const ElementKind kind = page.media->kind == MediaKind::Video
                ? ElementKind::VideoMedia : ElementKind::ImageMedia;
            plan.insertions.append(LayoutInsertion{ LayoutRegion::Bottom, 0, kind,
                                     QSizeF(width, remaining), remaining, remaining });
        } else {
            qCDebug(lcLayout) << "Skipping media without payload.";
        }
    } else if (page.body) {
        const QSizeF bounds(width, remaining);
        const qreal height = m_metrics.bodyHeight(*page.body, bounds);
        plan.insertions.append(LayoutInsertion{ LayoutRegion::Top, topIndex, ElementKind::Body,
                                 bounds, height, remaining });
    }

    plan.remaining = remaining;
    qCDebug(lcLayout) << "Allocated" << plan.insertions.count() << "elements in" << container
                      << "remaining height:" << remaining;
    return plan;
}

} // namespace Onboarding
