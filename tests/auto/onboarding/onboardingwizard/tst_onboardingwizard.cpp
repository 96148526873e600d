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

#include <navigation.h>
#include <onboardingpage.h>
#include <onboardingwizard.h>

#include <QPushButton>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

using namespace Onboarding;

class RecordingTermination : public WizardTermination
{
public:
    void finish(ExitReason reason) override { reasons.append(reason); }

    QList<ExitReason> reasons;
};

static OnboardingData threePages()
{
    return OnboardingData::fromJson("{ \"pages\": ["
        "{ \"title\": \"One\", \"body\": \"First\" },"
        "{ \"title\": \"Two\", \"body\": \"Second\" },"
        "{ \"title\": \"Three\", \"body\": \"Third\" } ] }");
}

class tst_OnboardingWizard : public QObject
{
    Q_OBJECT

private slots:
    void testConstruction()
    {
        RecordingTermination termination;
        OnboardingWizard wizard(threePages(), Settings(), &termination);

        QCOMPARE(wizard.pageCount(), 3);
        QCOMPARE(wizard.currentIndex(), 0);
        QCOMPARE(wizard.windowTitle(), QLatin1String("Onboarding"));
        QCOMPARE(wizard.size(), QSize(780, 580));

        QVERIFY(wizard.pageAt(0)->position() == PagePosition::First);
        QVERIFY(wizard.pageAt(1)->position() == PagePosition::Middle);
        QVERIFY(wizard.pageAt(2)->position() == PagePosition::Last);
        QCOMPARE(wizard.pageAt(2)->index(), 2);
        QCOMPARE(*wizard.pageAt(1)->page().title, QLatin1String("Two"));
    }

    void testSinglePageWizard()
    {
        RecordingTermination termination;
        OnboardingWizard wizard(OnboardingData::fromJson("{ \"pages\": [ { \"title\": \"Only\" } ] }"),
            Settings(), &termination);

        QCOMPARE(wizard.pageCount(), 1);
        QVERIFY(wizard.currentPage()->position() == PagePosition::SinglePage);

        wizard.currentPage()->pressRightButton();
        QCOMPARE(termination.reasons.count(), 1);
    }

    void testAdvanceAndRetreat()
    {
        RecordingTermination termination;
        OnboardingWizard wizard(threePages(), Settings(), &termination);
        wizard.show();
        QVERIFY(QTest::qWaitForWindowExposed(&wizard));

        QSignalSpy spy(&wizard, &OnboardingWizard::currentPageChanged);

        QTest::mouseClick(wizard.currentPage()->findChild<QPushButton *>(QLatin1String("RightButton")),
            Qt::LeftButton);
        QCOMPARE(wizard.currentIndex(), 1);

        wizard.currentPage()->pressRightButton();
        QCOMPARE(wizard.currentIndex(), 2);

        wizard.currentPage()->pressLeftButton();
        QCOMPARE(wizard.currentIndex(), 1);

        QCOMPARE(spy.count(), 3);
        QCOMPARE(spy.at(0).at(0).toInt(), 1);
        QCOMPARE(spy.at(1).at(0).toInt(), 2);
        QCOMPARE(spy.at(2).at(0).toInt(), 1);
        QVERIFY(termination.reasons.isEmpty());
    }

    void testOutOfRangeNavigationIsIgnored()
    {
        OnboardingWizard wizard(threePages(), Settings(), nullptr);
        QSignalSpy spy(&wizard, &OnboardingWizard::currentPageChanged);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QLatin1String("Ignoring navigation to page -1")));
        wizard.onRetreat(0);
        QCOMPARE(wizard.currentIndex(), 0);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QLatin1String("not the current page")));
        wizard.onAdvance(2);
        QCOMPARE(wizard.currentIndex(), 0);

        QCOMPARE(spy.count(), 0);
    }

    void testFinish()
    {
        RecordingTermination termination;
        OnboardingWizard wizard(threePages(), Settings(), &termination);
        QSignalSpy finished(&wizard, &OnboardingWizard::onboardingFinished);

        wizard.onAdvance(0);
        wizard.onAdvance(1);
        QCOMPARE(wizard.currentIndex(), 2);

        wizard.currentPage()->pressRightButton();
        QCOMPARE(finished.count(), 1);
        QCOMPARE(termination.reasons.count(), 1);
        QVERIFY(termination.reasons.first() == ExitReason::UserFinishedOnboarding);
        QCOMPARE(wizard.result(), int(QDialog::Accepted));
    }

    void testDismissEndsOnboarding()
    {
        RecordingTermination termination;
        OnboardingWizard wizard(threePages(), Settings(), &termination);
        wizard.show();
        QVERIFY(QTest::qWaitForWindowExposed(&wizard));
        QSignalSpy finished(&wizard, &OnboardingWizard::onboardingFinished);

        wizard.onAdvance(0);
        QTest::keyClick(&wizard, Qt::Key_Escape);

        QCOMPARE(finished.count(), 1);
        QCOMPARE(termination.reasons.count(), 1);
        QVERIFY(termination.reasons.first() == ExitReason::UserFinishedOnboarding);
        QCOMPARE(wizard.result(), int(QDialog::Rejected));
        QVERIFY(!wizard.isVisible());
    }

    void testFinishWithoutTermination()
    {
        OnboardingWizard wizard(threePages(), Settings(), nullptr);
        QSignalSpy finished(&wizard, &OnboardingWizard::onboardingFinished);

        wizard.finish(ExitReason::UserFinishedOnboarding);
        QCOMPARE(finished.count(), 1);
    }
};

QTEST_MAIN(tst_OnboardingWizard)

#include "tst_onboardingwizard.moc"
