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

#include "pageposition.h"

#include "globals.h"
#include "navigation.h"

#include <QCoreApplication>

namespace Onboarding {

/*!
    Returns the button configuration for a page at \a position.

    \table
    \header \li Position \li Right \li Left \li Left hidden \li Right action \li Left action
    \row \li First \li Continue \li Back \li yes \li Advance \li None
    \row \li Middle \li Continue \li Back \li no \li Advance \li Retreat
    \row \li Last \li Close \li Back \li no \li Finish \li Retreat
    \row \li SinglePage \li Close \li Back \li yes \li Finish \li None
    \endtable

    The right button is never hidden.
*/
ButtonConfig configure(PagePosition position)
{
    const QString continueText = QCoreApplication::translate("Onboarding::PagePosition", "Continue");
    const QString closeText = QCoreApplication::translate("Onboarding::PagePosition", "Close");
    const QString backText = QCoreApplication::translate("Onboarding::PagePosition", "Back");

    switch (position) {
    case PagePosition::First:
        return { continueText, backText, false, true,
                 NavigationAction::Advance, NavigationAction::None };
    case PagePosition::Middle:
        return { continueText, backText, false, false,
                 NavigationAction::Advance, NavigationAction::Retreat };
    case PagePosition::Last:
        return { closeText, backText, false, false,
                 NavigationAction::Finish, NavigationAction::Retreat };
    case PagePosition::SinglePage:
        return { closeText, backText, false, true,
                 NavigationAction::Finish, NavigationAction::None };
    }
    return ButtonConfig();
}

/*!
    Returns the position of the page at \a index in a wizard of \a count pages.
*/
PagePosition positionForIndex(int index, int count)
{
    if (count <= 1)
        return PagePosition::SinglePage;
    if (index <= 0)
        return PagePosition::First;
    if (index >= count - 1)
        return PagePosition::Last;
    return PagePosition::Middle;
}

/*!
    Performs \a action for the page at index \a fromPage. Advance and retreat are
    reported to \a delegate, finish to \a termination. NavigationAction::None and
    missing collaborators deliver nothing.
*/
void dispatch(NavigationAction action, int fromPage, NavigationDelegate *delegate,
    WizardTermination *termination)
{
    switch (action) {
    case NavigationAction::None:
        break;
    case NavigationAction::Advance:
        qCDebug(lcNavigation) << "Advance requested from page" << fromPage;
        if (delegate)
            delegate->onAdvance(fromPage);
        break;
    case NavigationAction::Retreat:
        qCDebug(lcNavigation) << "Retreat requested from page" << fromPage;
        if (delegate)
            delegate->onRetreat(fromPage);
        break;
    case NavigationAction::Finish:
        qCDebug(lcNavigation) << "Finish requested from page" << fromPage;
        if (termination)
            termination->finish(ExitReason::UserFinishedOnboarding);
        break;
    }
}

/*!
    Returns the accessible name of the right button of a page at \a position.
    Only the last page of a multi-page onboarding announces closing.
*/
QString rightButtonAccessibleName(PagePosition position)
{
    if (position == PagePosition::Last)
        return QCoreApplication::translate("Onboarding::PagePosition", "Close the onboarding");
    return QCoreApplication::translate("Onboarding::PagePosition", "Continue to the next page");
}

QString toString(PagePosition position)
{
    switch (position) {
    case PagePosition::First:
        return QLatin1String("first");
    case PagePosition::Middle:
        return QLatin1String("middle");
    case PagePosition::Last:
        return QLatin1String("last");
    case PagePosition::SinglePage:
        return QLatin1String("singlePage");
    }
    return QString();
}

} // namespace Onboarding
