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

#include <accessoryviews.h>
#include <gravityareawidget.h>
#include <markdowntextview.h>
#include <navigation.h>
#include <onboardingpage.h>

#include <QLabel>
#include <QPushButton>
#include <QSignalSpy>
#include <QTest>

using namespace Onboarding;

class RecordingNavigation : public NavigationDelegate, public WizardTermination
{
public:
    void onAdvance(int fromPage) override { advanced.append(fromPage); }
    void onRetreat(int fromPage) override { retreated.append(fromPage); }
    void finish(ExitReason) override { ++finished; }

    int eventCount() const { return advanced.count() + retreated.count() + finished; }

    QList<int> advanced;
    QList<int> retreated;
    int finished = 0;
};

static OnboardingPage textPage()
{
    OnboardingPage page;
    page.title = QLatin1String("Welcome");
    page.subtitle = QLatin1String("A short tour");
    page.body = QLatin1String("This is **markdown** with a [link](https://example.com).");
    return page;
}

static OnboardingPage imagePage()
{
    OnboardingPage page;
    page.title = QLatin1String("Look");
    page.body = QLatin1String("Caption");
    OnboardingMedia media;
    media.kind = MediaKind::Image;
    media.image = QImage(200, 100, QImage::Format_ARGB32);
    media.image.fill(Qt::darkGreen);
    page.media = media;
    return page;
}

class tst_OnboardingPage : public QObject
{
    Q_OBJECT

private slots:
    void testButtonsOfFirstPage()
    {
        RecordingNavigation navigation;
        OnboardingPageWidget page(textPage(), PagePosition::First, 0, &navigation, &navigation);
        page.renderPage();

        QPushButton *left = page.findChild<QPushButton *>(QLatin1String("LeftButton"));
        QPushButton *right = page.findChild<QPushButton *>(QLatin1String("RightButton"));
        QVERIFY(left);
        QVERIFY(right);
        QVERIFY(left->isHidden());
        QVERIFY(!right->isHidden());
        QCOMPARE(right->text(), QLatin1String("Continue"));
        QCOMPARE(right->accessibleName(), QLatin1String("Continue to the next page"));

        page.pressLeftButton();
        QCOMPARE(navigation.eventCount(), 0);

        page.pressRightButton();
        QCOMPARE(navigation.advanced, QList<int>() << 0);
        QCOMPARE(navigation.eventCount(), 1);
    }

    void testButtonsOfMiddlePage()
    {
        RecordingNavigation navigation;
        OnboardingPageWidget page(textPage(), PagePosition::Middle, 1, &navigation, &navigation);
        page.resize(480, 640);
        page.show();
        QVERIFY(QTest::qWaitForWindowExposed(&page));

        QPushButton *left = page.findChild<QPushButton *>(QLatin1String("LeftButton"));
        QVERIFY(!left->isHidden());
        QCOMPARE(left->text(), QLatin1String("Back"));

        QTest::mouseClick(left, Qt::LeftButton);
        QCOMPARE(navigation.retreated, QList<int>() << 1);

        QTest::mouseClick(page.findChild<QPushButton *>(QLatin1String("RightButton")), Qt::LeftButton);
        QCOMPARE(navigation.advanced, QList<int>() << 1);
    }

    void testButtonsOfLastPage()
    {
        RecordingNavigation navigation;
        OnboardingPageWidget page(textPage(), PagePosition::Last, 2, &navigation, &navigation);
        page.renderPage();

        QPushButton *right = page.findChild<QPushButton *>(QLatin1String("RightButton"));
        QCOMPARE(right->text(), QLatin1String("Close"));
        QCOMPARE(right->accessibleName(), QLatin1String("Close the onboarding"));

        page.pressRightButton();
        QCOMPARE(navigation.finished, 1);
        QVERIFY(navigation.advanced.isEmpty());

        page.pressLeftButton();
        QCOMPARE(navigation.retreated, QList<int>() << 2);
    }

    void testSinglePage()
    {
        RecordingNavigation navigation;
        OnboardingPageWidget page(textPage(), PagePosition::SinglePage, 0, &navigation, &navigation);
        page.renderPage();

        QVERIFY(page.findChild<QPushButton *>(QLatin1String("LeftButton"))->isHidden());
        QPushButton *right = page.findChild<QPushButton *>(QLatin1String("RightButton"));
        QCOMPARE(right->text(), QLatin1String("Close"));
        QCOMPARE(right->accessibleName(), QLatin1String("Continue to the next page"));

        page.pressLeftButton();
        QCOMPARE(navigation.eventCount(), 0);
        page.pressRightButton();
        QCOMPARE(navigation.finished, 1);
    }

    void testHelpButtonVisibility()
    {
        OnboardingPageWidget withoutHelp(textPage(), PagePosition::First, 0, nullptr, nullptr);
        withoutHelp.renderPage();
        QVERIFY(withoutHelp.findChild<QPushButton *>(QLatin1String("HelpButton"))->isHidden());

        OnboardingPage page = textPage();
        InfoSection section;
        section.fields.append(InfoField{ QLatin1String("Version"), QLatin1String("2.1") });
        page.infoSection = section;

        OnboardingPageWidget withHelp(page, PagePosition::First, 0, nullptr, nullptr);
        withHelp.renderPage();
        QVERIFY(!withHelp.findChild<QPushButton *>(QLatin1String("HelpButton"))->isHidden());
    }

    void testTextPageRegions()
    {
        OnboardingPageWidget page(textPage(), PagePosition::First, 0, nullptr, nullptr);
        page.resize(480, 640);
        page.show();
        QVERIFY(QTest::qWaitForWindowExposed(&page));

        const LayoutPlan plan = page.lastPlan();
        QCOMPARE(plan.insertionsIn(LayoutRegion::Top).count(), 3);
        QVERIFY(plan.insertionsIn(LayoutRegion::Center).isEmpty());
        QVERIFY(plan.insertionsIn(LayoutRegion::Bottom).isEmpty());

        GravityAreaWidget *area = page.findChild<GravityAreaWidget *>();
        QVERIFY(area);
        const QList<QWidget *> top = area->widgets(LayoutRegion::Top);
        QCOMPARE(top.count(), 3);
        QCOMPARE(top.at(0)->objectName(), QLatin1String("TitleLabel"));
        QCOMPARE(top.at(1)->objectName(), QLatin1String("SubtitleLabel"));
        QVERIFY(qobject_cast<MarkdownTextView *>(top.at(2)));
        QCOMPARE(qobject_cast<QLabel *>(top.at(0))->text(), QLatin1String("Welcome"));
    }

    void testImagePageRegions()
    {
        OnboardingPageWidget page(imagePage(), PagePosition::Middle, 1, nullptr, nullptr);
        page.resize(480, 640);
        page.show();
        QVERIFY(QTest::qWaitForWindowExposed(&page));

        GravityAreaWidget *area = page.findChild<GravityAreaWidget *>();
        QVERIFY(area);
        QCOMPARE(area->widgets(LayoutRegion::Top).count(), 1);
        QCOMPARE(area->widgets(LayoutRegion::Center).count(), 1);
        QVERIFY(qobject_cast<MarkdownTextView *>(area->widgets(LayoutRegion::Center).first()));
        QCOMPARE(area->widgets(LayoutRegion::Bottom).count(), 1);
        QVERIFY(qobject_cast<ImageAccessoryView *>(area->widgets(LayoutRegion::Bottom).first()));
    }

    void testRenderReplacesPreviousElements()
    {
        OnboardingPageWidget page(imagePage(), PagePosition::Middle, 1, nullptr, nullptr);
        page.resize(480, 640);

        QSignalSpy spy(&page, &OnboardingPageWidget::rendered);
        const LayoutPlan first = page.renderPage();
        const LayoutPlan second = page.renderPage();
        QCOMPARE(spy.count(), 2);
        QVERIFY(first == second);

        QCOMPARE(page.findChildren<QLabel *>(QLatin1String("TitleLabel")).count(), 1);
        QCOMPARE(page.findChildren<MarkdownTextView *>().count(), 1);
        QCOMPARE(page.findChildren<ImageAccessoryView *>().count(), 1);
    }

    void testTopIcon()
    {
        OnboardingPage data = textPage();
        data.topIcon = QLatin1String("/no/such/icon.png");

        OnboardingPageWidget page(data, PagePosition::First, 0, nullptr, nullptr);
        page.renderPage();

        QLabel *icon = page.findChild<QLabel *>(QLatin1String("TopIconLabel"));
        QVERIFY(icon);
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
        QVERIFY(icon->pixmap() && !icon->pixmap()->isNull());
#else
        QVERIFY(!icon->pixmap().isNull());
#endif
        QCOMPARE(icon->accessibleName(), QLatin1String("Onboarding page icon"));
    }
};

QTEST_MAIN(tst_OnboardingPage)

#include "tst_onboardingpage.moc"
