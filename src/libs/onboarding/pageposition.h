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

#ifndef PAGEPOSITION_H
#define PAGEPOSITION_H

#include "onboarding_global.h"

#include <QtCore/QString>

namespace Onboarding {

class NavigationDelegate;
class WizardTermination;

// The ordinal role of a page inside the wizard. Closed set: a new value
// needs a new row in configure().
enum class PagePosition {
    First,
    Middle,
    Last,
    SinglePage
};

enum class NavigationAction {
    None,
    Advance,
    Retreat,
    Finish
};

struct ONBOARDING_EXPORT ButtonConfig
{
    QString rightLabel;
    QString leftLabel;
    bool isRightHidden = false;
    bool isLeftHidden = false;
    NavigationAction rightAction = NavigationAction::None;
    NavigationAction leftAction = NavigationAction::None;
};

ONBOARDING_EXPORT ButtonConfig configure(PagePosition position);
ONBOARDING_EXPORT PagePosition positionForIndex(int index, int count);

ONBOARDING_EXPORT void dispatch(NavigationAction action, int fromPage,
    NavigationDelegate *delegate, WizardTermination *termination);

ONBOARDING_EXPORT QString rightButtonAccessibleName(PagePosition position);
ONBOARDING_EXPORT QString toString(PagePosition position);

} // namespace Onboarding

#endif // PAGEPOSITION_H
