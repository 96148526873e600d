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

#include "accessoryviews.h"

#include <QDesktopServices>
#include <QFileInfo>
#include <QMouseEvent>
#include <QtMath>

using namespace Onboarding;

static QSize boundedSize(const QSizeF &size)
{
    return QSize(qMax(1, qFloor(size.width())), qMax(1, qFloor(size.height())));
}

/*!
    \class Onboarding::ImageAccessoryView
    \brief The ImageAccessoryView class shows the image of a page, scaled into
    its preferred size while keeping the original aspect ratio.
*/

/*!
    Constructs the view for \a image, bounded to \a preferredSize, with \a parent
    as parent.
*/
ImageAccessoryView::ImageAccessoryView(const QImage &image, const QSizeF &preferredSize,
        QWidget *parent)
    : QLabel(parent)
    , m_pixmap(QPixmap::fromImage(image))
    , m_preferredSize(boundedSize(preferredSize))
{
    setObjectName(QLatin1String("ImageAccessoryView"));
    setMinimumSize(1, 1);
    setMaximumSize(m_preferredSize);
    setScaledContents(false);
    setAlignment(Qt::AlignHCenter | Qt::AlignVCenter);
    setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Preferred);
    QLabel::setPixmap(scaledPixmap());
}

/*!
    \reimp
*/
int ImageAccessoryView::heightForWidth(int w) const
{
    return m_pixmap.isNull()
        ? height()
        : qMin(m_preferredSize.height(), m_pixmap.height() * w / m_pixmap.width());
}

/*!
    \reimp
*/
QSize ImageAccessoryView::sizeHint() const
{
    if (m_pixmap.isNull())
        return m_preferredSize;
    return m_pixmap.size().scaled(m_preferredSize, Qt::KeepAspectRatio);
}

/*!
    Returns the image scaled to the label size, while preserving the original
    aspect ratio.
*/
QPixmap ImageAccessoryView::scaledPixmap() const
{
    if (m_pixmap.isNull())
        return QPixmap();

    const QSize target = size().boundedTo(m_preferredSize);
    return m_pixmap.scaled(target * m_pixmap.devicePixelRatio(),
        Qt::KeepAspectRatio, Qt::SmoothTransformation);
}

/*!
    \reimp
*/
void ImageAccessoryView::resizeEvent(QResizeEvent *event)
{
    Q_UNUSED(event);

    if (!m_pixmap.isNull())
        QLabel::setPixmap(scaledPixmap());
}


/*!
    \class Onboarding::VideoAccessoryView
    \brief The VideoAccessoryView class shows a clickable poster for the video of
    a page. Clicking it plays the video in the system's default player.
*/

VideoAccessoryView::VideoAccessoryView(const QUrl &video, const QSizeF &preferredSize,
        QWidget *parent)
    : QLabel(parent)
    , m_video(video)
    , m_preferredSize(boundedSize(preferredSize))
{
    setObjectName(QLatin1String("VideoAccessoryView"));
    setMaximumSize(m_preferredSize);
    setAlignment(Qt::AlignCenter);
    setWordWrap(true);
    setFrameShape(QFrame::StyledPanel);
    setTextFormat(Qt::RichText);

    const QString name = video.isLocalFile() ? QFileInfo(video.toLocalFile()).fileName()
                                             : video.toDisplayString();
    setText(QString::fromLatin1("<span style=\"font-size:32pt\">&#9654;</span><br>%1")
        .arg(name.toHtmlEscaped()));
    setToolTip(tr("Play %1").arg(name));

    connect(this, &VideoAccessoryView::playRequested, this, [](const QUrl &url) {
        QDesktopServices::openUrl(url);
    });
}

QSize VideoAccessoryView::sizeHint() const
{
    // 16:9 poster inside the preferred size
    return QSize(16, 9).scaled(m_preferredSize, Qt::KeepAspectRatio);
}

/*!
    \reimp
*/
bool VideoAccessoryView::event(QEvent *e)
{
    if (e->type() == QEvent::Enter)
        setCursor(Qt::PointingHandCursor);
    return QLabel::event(e);
}

/*!
    \reimp
*/
void VideoAccessoryView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton)
        emit playRequested(m_video);
}
