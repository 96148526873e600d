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

#ifndef NAVIGATION_H
#define NAVIGATION_H

#include "onboarding_global.h"

#include <QtCore/QString>

namespace Onboarding {

enum class ExitReason {
    UserFinishedOnboarding
};

ONBOARDING_EXPORT QString exitReasonDescription(ExitReason reason);
ONBOARDING_EXPORT int exitCode(ExitReason reason);

// Receives the navigation intent of a page. The page never sequences itself.
class ONBOARDING_EXPORT NavigationDelegate
{
public:
    virtual ~NavigationDelegate() {}

    virtual void onAdvance(int fromPage) = 0;
    virtual void onRetreat(int fromPage) = 0;
};

class ONBOARDING_EXPORT WizardTermination
{
public:
    virtual ~WizardTermination() {}

    virtual void finish(ExitReason reason) = 0;
};

// Quits the running event loop with the exit code that belongs to the reason.
class ONBOARDING_EXPORT ApplicationExit : public WizardTermination
{
public:
    void finish(ExitReason reason) override;
};

} // namespace Onboarding

#endif // NAVIGATION_H
