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

#include "markdowntextview.h"

#include <QTextBlockFormat>
#include <QTextCursor>
#include <QtMath>

using namespace Onboarding;

/*!
    \class Onboarding::MarkdownTextView
    \brief The MarkdownTextView class shows centered, read-only markdown text
    whose height never exceeds a maximum. Longer text scrolls.
*/

MarkdownTextView::MarkdownTextView(const QString &markdown, QWidget *parent)
    : QTextBrowser(parent)
    , m_maxViewHeight(QWIDGETSIZE_MAX)
{
    setObjectName(QLatin1String("BodyTextView"));
    setReadOnly(true);
    setOpenExternalLinks(true);
    setFrameShape(QFrame::NoFrame);
    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    viewport()->setAutoFillBackground(false);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);

    setMarkdown(markdown);

    QTextCursor cursor(document());
    cursor.select(QTextCursor::Document);
    QTextBlockFormat format;
    format.setAlignment(Qt::AlignHCenter);
    cursor.mergeBlockFormat(format);
}

/*!
    Limits the height of the view to \a height. Negative heights collapse the
    view.
*/
void MarkdownTextView::setMaxViewHeight(qreal height)
{
    m_maxViewHeight = height;
    setFixedHeight(qMax(0, qCeil(height)));
}

QSize MarkdownTextView::sizeHint() const
{
    const int documentHeight = qCeil(document()->size().height());
    return QSize(QTextBrowser::sizeHint().width(),
        qMin(documentHeight, qMax(0, qCeil(m_maxViewHeight))));
}
