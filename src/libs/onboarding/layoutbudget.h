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

#ifndef LAYOUTBUDGET_H
#define LAYOUTBUDGET_H

#include "constants.h"
#include "onboarding_global.h"

#include <QtCore/QList>
#include <QtCore/QSizeF>
#include <QtGui/QFont>

namespace Onboarding {

struct OnboardingPage;

// Named slots of a gravity area container. Top items stack downward in
// insertion order, bottom items stack upward, center holds one block.
enum class LayoutRegion {
    Top,
    Center,
    Bottom
};

enum class ElementKind {
    Title,
    Subtitle,
    Body,
    ImageMedia,
    VideoMedia
};

struct ONBOARDING_EXPORT LayoutInsertion
{
    LayoutRegion region;
    int index;
    ElementKind kind;
    QSizeF requestedSize;
    qreal measuredHeight;
    qreal remainingAfter;

    bool operator==(const LayoutInsertion &other) const;
    bool operator!=(const LayoutInsertion &other) const { return !(*this == other); }
};

struct ONBOARDING_EXPORT LayoutPlan
{
    QList<LayoutInsertion> insertions;
    qreal remaining = 0;

    QList<LayoutInsertion> insertionsIn(LayoutRegion region) const;
    bool contains(ElementKind kind) const;

    bool operator==(const LayoutPlan &other) const;
    bool operator!=(const LayoutPlan &other) const { return !(*this == other); }
};

class ONBOARDING_EXPORT ContentMetrics
{
public:
    virtual ~ContentMetrics() {}

    virtual qreal titleHeight(const QString &text, qreal width) const = 0;
    virtual qreal subtitleHeight(const QString &text, qreal width) const = 0;
    // Height of the body view when it may grow up to bounds.height().
    virtual qreal bodyHeight(const QString &markdown, const QSizeF &bounds) const = 0;
};

class ONBOARDING_EXPORT FontContentMetrics : public ContentMetrics
{
public:
    FontContentMetrics();
    FontContentMetrics(const QFont &titleFont, const QFont &subtitleFont, const QFont &bodyFont);

    static QFont defaultTitleFont();
    static QFont defaultSubtitleFont();

    QFont titleFont() const { return m_titleFont; }
    QFont subtitleFont() const { return m_subtitleFont; }
    QFont bodyFont() const { return m_bodyFont; }

    qreal titleHeight(const QString &text, qreal width) const override;
    qreal subtitleHeight(const QString &text, qreal width) const override;
    qreal bodyHeight(const QString &markdown, const QSizeF &bounds) const override;

private:
    QFont m_titleFont;
    QFont m_subtitleFont;
    QFont m_bodyFont;
};

class ONBOARDING_EXPORT LayoutBudgetAllocator
{
public:
    explicit LayoutBudgetAllocator(const ContentMetrics &metrics, qreal spacing = scDefaultSpacing);

    qreal spacing() const { return m_spacing; }

    LayoutPlan allocate(const QSizeF &container, const OnboardingPage &page) const;

private:
    const ContentMetrics &m_metrics;
    qreal m_spacing;
};

} // namespace Onboarding

#endif // LAYOUTBUDGET_H
