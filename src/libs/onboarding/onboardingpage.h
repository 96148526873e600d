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

#ifndef ONBOARDINGPAGE_H
#define ONBOARDINGPAGE_H

#include "iconresolver.h"
#include "layoutbudget.h"
#include "onboardingdata.h"
#include "pageposition.h"

#include <QWidget>

QT_BEGIN_NAMESPACE
class QLabel;
class QPushButton;
QT_END_NAMESPACE

namespace Onboarding {

class GravityAreaWidget;
class NavigationDelegate;
class WizardTermination;

class ONBOARDING_EXPORT OnboardingPageWidget : public QWidget
{
    Q_OBJECT
    Q_DISABLE_COPY(OnboardingPageWidget)

public:
    OnboardingPageWidget(const OnboardingPage &page, PagePosition position, int index,
        NavigationDelegate *delegate, WizardTermination *termination, QWidget *parent = nullptr);

    OnboardingPage page() const { return m_page; }
    PagePosition position() const { return m_position; }
    int index() const { return m_index; }

    void setSpacing(int spacing);
    void setTitleColor(const QString &color);
    void setIconResolver(const IconResolver &resolver);

    LayoutPlan renderPage();
    LayoutPlan lastPlan() const { return m_plan; }

public Q_SLOTS:
    void pressRightButton();
    void pressLeftButton();
    void pressHelpButton();

Q_SIGNALS:
    void rendered();

protected:
    void showEvent(QShowEvent *event) override;

private:
    void setupBodyLayout();
    void setupButtonsLayout();
    void configureAccessibilityElements();
    void setIconIfNeeded();

    QWidget *createElement(const LayoutInsertion &insertion);

private:
    const OnboardingPage m_page;
    const PagePosition m_position;
    const int m_index;
    NavigationDelegate *m_delegate;
    WizardTermination *m_termination;

    int m_spacing;
    QString m_titleColor;
    IconResolver m_iconResolver;
    FontContentMetrics m_metrics;
    LayoutPlan m_plan;

    QLabel *m_topIconLabel;
    GravityAreaWidget *m_bodyArea;
    QPushButton *m_leftButton;
    QPushButton *m_helpButton;
    QPushButton *m_rightButton;
};

} // namespace Onboarding

#endif // ONBOARDINGPAGE_H
