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

#include "navigation.h"

#include "globals.h"

#include <QCoreApplication>

namespace Onboarding {

/*!
    Returns the human readable description of \a reason as written to the log.
*/
QString exitReasonDescription(ExitReason reason)
{
    switch (reason) {
    case ExitReason::UserFinishedOnboarding:
        return QLatin1String("user completed onboarding");
    }
    return QString();
}

/*!
    Returns the process exit code that reports \a reason.
*/
int exitCode(ExitReason reason)
{
    switch (reason) {
    case ExitReason::UserFinishedOnboarding:
        return 0;
    }
    return 1;
}

/*!
    \class Onboarding::ApplicationExit
    \brief Terminates the onboarding application.
*/

void ApplicationExit::finish(ExitReason reason)
{
    qCDebug(lcNavigation) << "Exiting:" << exitReasonDescription(reason);
    QCoreApplication::exit(exitCode(reason));
}

} // namespace Onboarding
