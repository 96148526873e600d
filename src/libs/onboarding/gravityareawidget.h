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

#ifndef GRAVITYAREAWIDGET_H
#define GRAVITYAREAWIDGET_H

#include "layoutbudget.h"
#include "onboarding_global.h"

#include <QWidget>

QT_BEGIN_NAMESPACE
class QVBoxLayout;
QT_END_NAMESPACE

namespace Onboarding {

class ONBOARDING_EXPORT GravityAreaWidget : public QWidget
{
    Q_OBJECT
    Q_DISABLE_COPY(GravityAreaWidget)

public:
    explicit GravityAreaWidget(QWidget *parent = nullptr);

    void insertWidget(QWidget *widget, int index, LayoutRegion region,
        Qt::Alignment alignment = Qt::Alignment());
    QList<QWidget *> widgets(LayoutRegion region) const;
    void clear();

    void setSpacing(int spacing);
    int spacing() const;

private:
    QVBoxLayout *areaLayout(LayoutRegion region) const;

private:
    QVBoxLayout *m_top;
    QVBoxLayout *m_center;
    QVBoxLayout *m_bottom;
};

} // namespace Onboarding

#endif // GRAVITYAREAWIDGET_H
