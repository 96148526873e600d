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

#ifndef ACCESSORYVIEWS_H
#define ACCESSORYVIEWS_H

#include "onboarding_global.h"

#include <QLabel>
#include <QUrl>

namespace Onboarding {

class ONBOARDING_EXPORT ImageAccessoryView : public QLabel
{
    Q_OBJECT
    Q_DISABLE_COPY(ImageAccessoryView)

public:
    explicit ImageAccessoryView(const QImage &image, const QSizeF &preferredSize,
        QWidget *parent = nullptr);

    QSize preferredSize() const { return m_preferredSize; }

    int heightForWidth(int w) const override;
    QSize sizeHint() const override;

protected:
    void resizeEvent(QResizeEvent *event) override;

private:
    QPixmap scaledPixmap() const;

private:
    QPixmap m_pixmap;
    QSize m_preferredSize;
};

class ONBOARDING_EXPORT VideoAccessoryView : public QLabel
{
    Q_OBJECT
    Q_DISABLE_COPY(VideoAccessoryView)

public:
    explicit VideoAccessoryView(const QUrl &video, const QSizeF &preferredSize,
        QWidget *parent = nullptr);

    QUrl video() const { return m_video; }
    QSize preferredSize() const { return m_preferredSize; }

    QSize sizeHint() const override;

Q_SIGNALS:
    void playRequested(const QUrl &video);

protected:
    bool event(QEvent *e) override;
    void mousePressEvent(QMouseEvent *event) override;

private:
    QUrl m_video;
    QSize m_preferredSize;
};

} // namespace Onboarding

#endif // ACCESSORYVIEWS_H
