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

#ifndef ONBOARDINGWIZARD_H
#define ONBOARDINGWIZARD_H

#include "navigation.h"
#include "onboardingdata.h"
#include "settings.h"

#include <QDialog>

QT_BEGIN_NAMESPACE
class QStackedWidget;
QT_END_NAMESPACE

namespace Onboarding {

class OnboardingPageWidget;

class ONBOARDING_EXPORT OnboardingWizard : public QDialog, public NavigationDelegate,
    public WizardTermination
{
    Q_OBJECT
    Q_DISABLE_COPY(OnboardingWizard)

public:
    OnboardingWizard(const OnboardingData &data, const Settings &settings,
        WizardTermination *termination, QWidget *parent = nullptr);

    int currentIndex() const;
    int pageCount() const;
    OnboardingPageWidget *pageAt(int index) const;
    OnboardingPageWidget *currentPage() const;

    void onAdvance(int fromPage) override;
    void onRetreat(int fromPage) override;
    void finish(ExitReason reason) override;

public Q_SLOTS:
    void reject() override;

Q_SIGNALS:
    void currentPageChanged(int index);
    void onboardingFinished();

private:
    void moveTo(int fromPage, int toPage);
    void endOnboarding(ExitReason reason);

private:
    WizardTermination *m_termination;
    QStackedWidget *m_stack;
};

} // namespace Onboarding

#endif // ONBOARDINGWIZARD_H
