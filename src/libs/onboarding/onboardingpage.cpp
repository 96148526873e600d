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

#include "onboardingpage.h"

#include "accessoryviews.h"
#include "globals.h"
#include "gravityareawidget.h"
#include "infopopup.h"
#include "markdowntextview.h"
#include "navigation.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QShowEvent>
#include <QVBoxLayout>

using namespace Onboarding;

static const int scTopIconSize = 64;

/*!
    \class Onboarding::OnboardingPageWidget
    \brief The OnboardingPageWidget class renders one page of the onboarding
    wizard and turns button presses into navigation requests.

    Every time the page is shown it:

    \list 1
        \li lays out title, subtitle, body and media with a LayoutBudgetAllocator,
            replacing the elements of the previous render,
        \li configures the left, help and right buttons from the page position,
        \li sets the accessible names of the controls,
        \li loads the top icon.
    \endlist

    The page reports navigation to the NavigationDelegate and termination to the
    WizardTermination passed at construction. Neither is owned by the page.
*/

OnboardingPageWidget::OnboardingPageWidget(const OnboardingPage &page, PagePosition position,
        int index, NavigationDelegate *delegate, WizardTermination *termination, QWidget *parent)
    : QWidget(parent)
    , m_page(page)
    , m_position(position)
    , m_index(index)
    , m_delegate(delegate)
    , m_termination(termination)
    , m_spacing(scDefaultSpacing)
    , m_metrics(FontContentMetrics::defaultTitleFont(), FontContentMetrics::defaultSubtitleFont(), font())
{
    setObjectName(QString::fromLatin1("OnboardingPage%1").arg(index));

    m_topIconLabel = new QLabel(this);
    m_topIconLabel->setObjectName(QLatin1String("TopIconLabel"));
    m_topIconLabel->setFixedSize(scTopIconSize, scTopIconSize);
    m_topIconLabel->setAlignment(Qt::AlignCenter);

    m_bodyArea = new GravityAreaWidget(this);
    m_bodyArea->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

    m_leftButton = new QPushButton(this);
    m_leftButton->setObjectName(QLatin1String("LeftButton"));
    connect(m_leftButton, &QAbstractButton::clicked, this, &OnboardingPageWidget::pressLeftButton);

    m_helpButton = new QPushButton(tr("?"), this);
    m_helpButton->setObjectName(QLatin1String("HelpButton"));
    connect(m_helpButton, &QAbstractButton::clicked, this, &OnboardingPageWidget::pressHelpButton);

    m_rightButton = new QPushButton(this);
    m_rightButton->setObjectName(QLatin1String("RightButton"));
    m_rightButton->setDefault(true);
    connect(m_rightButton, &QAbstractButton::clicked, this, &OnboardingPageWidget::pressRightButton);

    QHBoxLayout *buttonLayout = new QHBoxLayout;
    buttonLayout->addWidget(m_leftButton);
    buttonLayout->addStretch(1);
    buttonLayout->addWidget(m_helpButton);
    buttonLayout->addStretch(1);
    buttonLayout->addWidget(m_rightButton);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->setSpacing(m_spacing);
    layout->addWidget(m_topIconLabel, 0, Qt::AlignHCenter);
    layout->addWidget(m_bodyArea, 1);
    layout->addLayout(buttonLayout);
}

void OnboardingPageWidget::setSpacing(int spacing)
{
    m_spacing = spacing;
    m_bodyArea->setSpacing(spacing);
}

void OnboardingPageWidget::setTitleColor(const QString &color)
{
    m_titleColor = color;
}

void OnboardingPageWidget::setIconResolver(const IconResolver &resolver)
{
    m_iconResolver = resolver;
}

/*!
    Renders the page into its current geometry and returns the layout plan that
    was applied. Elements of an earlier render are deleted first.
*/
LayoutPlan OnboardingPageWidget::renderPage()
{
    setupBodyLayout();
    setupButtonsLayout();
    configureAccessibilityElements();
    setIconIfNeeded();

    emit rendered();
    return m_plan;
}

void OnboardingPageWidget::showEvent(QShowEvent *event)
{
    QWidget::showEvent(event);
    if (!event->spontaneous())
        renderPage();
}

void OnboardingPageWidget::setupBodyLayout()
{
    m_bodyArea->clear();
    if (QLayout *l = layout())
        l->activate();

    const LayoutBudgetAllocator allocator(m_metrics, m_spacing);
    m_plan = allocator.allocate(QSizeF(m_bodyArea->contentsRect().size()), m_page);

    for (const LayoutInsertion &insertion : qAsConst(m_plan.insertions)) {
        QWidget *element = createElement(insertion);
        if (!element)
            continue;
        const bool media = insertion.kind == ElementKind::ImageMedia
            || insertion.kind == ElementKind::VideoMedia;
        m_bodyArea->insertWidget(element, insertion.index, insertion.region,
            media ? Qt::AlignHCenter : Qt::Alignment());
    }
}

QWidget *OnboardingPageWidget::createElement(const LayoutInsertion &insertion)
{
    switch (insertion.kind) {
    case ElementKind::Title:
    case ElementKind::Subtitle: {
        const bool title = insertion.kind == ElementKind::Title;
        QLabel *label = new QLabel(title ? *m_page.title : *m_page.subtitle);
        label->setObjectName(title ? QLatin1String("TitleLabel") : QLatin1String("SubtitleLabel"));
        label->setWordWrap(true);
        label->setAlignment(Qt::AlignHCenter);
        label->setTextFormat(Qt::PlainText);
        label->setFont(title ? m_metrics.titleFont() : m_metrics.subtitleFont());
        if (title && !m_titleColor.isEmpty()) {
            QPalette palette = label->palette();
            palette.setColor(QPalette::WindowText, QColor(m_titleColor));
            label->setPalette(palette);
        }
        return label;
    }
    case ElementKind::Body: {
        MarkdownTextView *view = new MarkdownTextView(*m_page.body);
        view->setFont(m_metrics.bodyFont());
        view->setMaxViewHeight(insertion.measuredHeight);
        return view;
    }
    case ElementKind::ImageMedia:
        return new ImageAccessoryView(m_page.media->image, insertion.requestedSize);
    case ElementKind::VideoMedia:
        return new VideoAccessoryView(m_page.media->video, insertion.requestedSize);
    }
    return nullptr;
}

void OnboardingPageWidget::setupButtonsLayout()
{
    const ButtonConfig config = configure(m_position);
    m_rightButton->setHidden(config.isRightHidden);
    m_leftButton->setHidden(config.isLeftHidden);
    m_rightButton->setText(config.rightLabel);
    m_leftButton->setText(config.leftLabel);
    m_helpButton->setHidden(!isHelpAvailable(m_page));
}

void OnboardingPageWidget::configureAccessibilityElements()
{
    m_rightButton->setAccessibleName(rightButtonAccessibleName(m_position));
    m_leftButton->setAccessibleName(tr("Go back to the previous page"));
    m_helpButton->setAccessibleName(tr("Show more information"));
    m_bodyArea->setAccessibleName(tr("Onboarding page content"));
    m_topIconLabel->setAccessibleName(tr("Onboarding page icon"));
}

void OnboardingPageWidget::setIconIfNeeded()
{
    const QImage icon = m_iconResolver.resolve(m_page.topIcon);
    QPixmap pixmap = QPixmap::fromImage(icon).scaled(m_topIconLabel->size() * devicePixelRatioF(),
        Qt::KeepAspectRatio, Qt::SmoothTransformation);
    pixmap.setDevicePixelRatio(devicePixelRatioF());
    m_topIconLabel->setPixmap(pixmap);
}

/*!
    Performs the right button action of the page position.
*/
void OnboardingPageWidget::pressRightButton()
{
    dispatch(configure(m_position).rightAction, m_index, m_delegate, m_termination);
}

/*!
    Performs the left button action of the page position. Pages that hide the
    left button have no left action, so the press does nothing.
*/
void OnboardingPageWidget::pressLeftButton()
{
    dispatch(configure(m_position).leftAction, m_index, m_delegate, m_termination);
}

/*!
    Presents the info section of the page next to the help button.
*/
void OnboardingPageWidget::pressHelpButton()
{
    if (!isHelpAvailable(m_page))
        return;

    InfoPopup *popup = new InfoPopup(*m_page.infoSection, this);
    popup->showRelativeTo(m_helpButton);
}
