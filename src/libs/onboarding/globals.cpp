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

#include "globals.h"

const char ONBOARDING_LAYOUT[] = "onboarding.layout";
const char ONBOARDING_NAVIGATION[] = "onboarding.navigation";
const char ONBOARDING_ICON[] = "onboarding.icon";
const char ONBOARDING_DATA[] = "onboarding.data";

namespace Onboarding
{

/*!
    \fn Onboarding::lcLayout()
    \internal
*/

/*!
    \fn Onboarding::lcNavigation()
    \internal
*/

/*!
    \fn Onboarding::lcIcon()
    \internal
*/

/*!
    \fn Onboarding::lcData()
    \internal
*/

Q_LOGGING_CATEGORY(lcLayout, ONBOARDING_LAYOUT)
Q_LOGGING_CATEGORY(lcNavigation, ONBOARDING_NAVIGATION)
Q_LOGGING_CATEGORY(lcIcon, ONBOARDING_ICON)
Q_LOGGING_CATEGORY(lcData, ONBOARDING_DATA)

/*!
    Returns available logging categories.
*/
QStringList loggingCategories()
{
    static QStringList categories = QStringList()
            << QLatin1String(ONBOARDING_LAYOUT)
            << QLatin1String(ONBOARDING_NAVIGATION)
            << QLatin1String(ONBOARDING_ICON)
            << QLatin1String(ONBOARDING_DATA);
    return categories;
}

} // namespace Onboarding
