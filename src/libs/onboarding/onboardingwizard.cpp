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

#include "onboardingwizard.h"

#include "globals.h"
#include "iconresolver.h"
#include "onboardingpage.h"
#include "pageposition.h"

#include <QStackedWidget>
#include <QVBoxLayout>

using namespace Onboarding;

/*!
    \class Onboarding::OnboardingWizard
    \brief The OnboardingWizard class hosts the pages of an onboarding in the
    order given by the onboarding data.

    The wizard owns its pages and acts as their NavigationDelegate. It also
    receives their finish requests, emits onboardingFinished() and forwards the
    request to the WizardTermination given at construction.
*/

OnboardingWizard::OnboardingWizard(const OnboardingData &data, const Settings &settings,
        WizardTermination *termination, QWidget *parent)
    : QDialog(parent)
    , m_termination(termination)
    , m_stack(new QStackedWidget(this))
{
    setObjectName(QLatin1String("OnboardingWizard"));
    setWindowTitle(settings.windowTitle());
    resize(settings.wizardDefaultWidth(), settings.wizardDefaultHeight());

    const IconResolver resolver(settings.defaultIcon());
    const QList<OnboardingPage> pages = data.pages();
    for (int i = 0; i < pages.count(); ++i) {
        OnboardingPageWidget *page = new OnboardingPageWidget(pages.at(i),
            positionForIndex(i, pages.count()), i, this, this, m_stack);
        page->setSpacing(settings.spacing());
        page->setTitleColor(settings.titleColor());
        page->setIconResolver(resolver);
        m_stack->addWidget(page);
    }

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(m_stack);
}

int OnboardingWizard::currentIndex() const
{
    return m_stack->currentIndex();
}

int OnboardingWizard::pageCount() const
{
    return m_stack->count();
}

OnboardingPageWidget *OnboardingWizard::pageAt(int index) const
{
    return qobject_cast<OnboardingPageWidget *>(m_stack->widget(index));
}

OnboardingPageWidget *OnboardingWizard::currentPage() const
{
    return pageAt(currentIndex());
}

void OnboardingWizard::onAdvance(int fromPage)
{
    moveTo(fromPage, fromPage + 1);
}

void OnboardingWizard::onRetreat(int fromPage)
{
    moveTo(fromPage, fromPage - 1);
}

/*!
    Ends the onboarding for \a reason.
*/
void OnboardingWizard::finish(ExitReason reason)
{
    endOnboarding(reason);
    accept();
}

/*!
    Dismisses the wizard when it is closed with the Escape key or the window's
    close button. The onboarding ends the same way as through the last page,
    but the dialog result is QDialog::Rejected.
*/
void OnboardingWizard::reject()
{
    qCDebug(lcNavigation) << "Onboarding dismissed on page" << currentIndex();
    endOnboarding(ExitReason::UserFinishedOnboarding);
    QDialog::reject();
}

void OnboardingWizard::endOnboarding(ExitReason reason)
{
    qCDebug(lcNavigation) << "Onboarding finished:" << exitReasonDescription(reason);
    emit onboardingFinished();
    if (m_termination)
        m_termination->finish(reason);
}

void OnboardingWizard::moveTo(int fromPage, int toPage)
{
    if (fromPage != currentIndex()) {
        qCWarning(lcNavigation) << "Ignoring navigation from page" << fromPage
                                << "which is not the current page" << currentIndex();
        return;
    }
    if (toPage < 0 || toPage >= pageCount()) {
        qCWarning(lcNavigation) << "Ignoring navigation to page" << toPage << "of" << pageCount();
        return;
    }

    m_stack->setCurrentIndex(toPage);
    qCDebug(lcNavigation) << "Showing page" << toPage << toString(pageAt(toPage)->position());
    emit currentPageChanged(toPage);
}
