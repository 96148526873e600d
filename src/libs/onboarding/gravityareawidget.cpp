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

#include "gravityareawidget.h"

#include <QVBoxLayout>

using namespace Onboarding;

/*!
    \class Onboarding::GravityAreaWidget
    \brief The GravityAreaWidget class is a vertical container with three
    areas: widgets in the top area are pinned to the top edge, widgets in the
    bottom area to the bottom edge, and the center area floats between them.
*/

GravityAreaWidget::GravityAreaWidget(QWidget *parent)
    : QWidget(parent)
    , m_top(new QVBoxLayout)
    , m_center(new QVBoxLayout)
    , m_bottom(new QVBoxLayout)
{
    setObjectName(QLatin1String("GravityAreaWidget"));

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addLayout(m_top);
    layout->addStretch(1);
    layout->addLayout(m_center);
    layout->addStretch(1);
    layout->addLayout(m_bottom);

    setSpacing(scDefaultSpacing);
}

/*!
    Inserts \a widget at \a index into the area named by \a region, using
    \a alignment inside its row. The container takes ownership of \a widget.
*/
void GravityAreaWidget::insertWidget(QWidget *widget, int index, LayoutRegion region,
    Qt::Alignment alignment)
{
    QVBoxLayout *area = areaLayout(region);
    area->insertWidget(qBound(0, index, area->count()), widget, 0, alignment);
}

/*!
    Returns the widgets of the area named by \a region from top to bottom.
*/
QList<QWidget *> GravityAreaWidget::widgets(LayoutRegion region) const
{
    QList<QWidget *> result;
    QVBoxLayout *area = areaLayout(region);
    for (int i = 0; i < area->count(); ++i) {
        if (QWidget *widget = area->itemAt(i)->widget())
            result.append(widget);
    }
    return result;
}

/*!
    Removes and deletes all widgets of all areas.
*/
void GravityAreaWidget::clear()
{
    for (QVBoxLayout *area : { m_top, m_center, m_bottom }) {
        while (QLayoutItem *item = area->takeAt(0)) {
            delete item->widget();
            delete item;
        }
    }
}

void GravityAreaWidget::setSpacing(int spacing)
{
    layout()->setSpacing(spacing);
    m_top->setSpacing(spacing);
    m_center->setSpacing(spacing);
    m_bottom->setSpacing(spacing);
}

int GravityAreaWidget::spacing() const
{
    return m_top->spacing();
}

QVBoxLayout *GravityAreaWidget::areaLayout(LayoutRegion region) const
{
    switch (region) {
    case LayoutRegion::Top:
        return m_top;
    case LayoutRegion::Center:
        return m_center;
    case LayoutRegion::Bottom:
        return m_bottom;
    }
    return m_top;
}
