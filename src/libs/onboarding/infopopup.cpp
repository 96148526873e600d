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

#include "infopopup.h"

#include <QFormLayout>
#include <QGuiApplication>
#include <QLabel>
#include <QScreen>

using namespace Onboarding;

/*!
    Returns \c true if \a page carries help content.
*/
bool Onboarding::isHelpAvailable(const OnboardingPage &page)
{
    return page.infoSection.has_value();
}

/*!
    \class Onboarding::InfoPopup
    \brief The InfoPopup class presents the info section of a page in a
    transient popup. The popup closes when the user clicks outside of it.
*/

InfoPopup::InfoPopup(const InfoSection &section, QWidget *parent)
    : QFrame(parent, Qt::Popup)
{
    setObjectName(QLatin1String("InfoPopup"));
    setAttribute(Qt::WA_DeleteOnClose);
    setFrameShape(QFrame::StyledPanel);

    QFormLayout *layout = new QFormLayout(this);
    layout->setRowWrapPolicy(QFormLayout::WrapLongRows);
    for (const InfoField &field : section.fields) {
        QLabel *label = new QLabel(field.label, this);
        QFont font = label->font();
        font.setBold(true);
        label->setFont(font);

        QLabel *description = new QLabel(field.description, this);
        description->setWordWrap(true);
        description->setTextInteractionFlags(Qt::TextSelectableByMouse);
        layout->addRow(label, description);
    }
}

/*!
    Shows the popup next to the right edge of \a anchor, kept inside the
    screen of \a anchor.
*/
void InfoPopup::showRelativeTo(QWidget *anchor)
{
    adjustSize();
    QPoint pos = anchor->mapToGlobal(QPoint(anchor->width(), (anchor->height() - height()) / 2));

    if (QScreen *screen = anchor->screen()) {
        const QRect available = screen->availableGeometry();
        if (pos.x() + width() > available.right())
            pos.setX(anchor->mapToGlobal(QPoint(0, 0)).x() - width());
        pos.setY(qBound(available.top(), pos.y(), qMax(available.top(), available.bottom() - height())));
    }
    move(pos);
    show();
}
