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

#include "iconresolver.h"

#include "globals.h"

#include <QFile>
#include <QFileInfo>
#include <QPainter>

namespace Onboarding {

/*!
    \class Onboarding::IconResolver
    \brief The IconResolver class loads the icon shown on top of an onboarding
    page.

    A page may name a custom icon file. If no file is named, the file does not
    exist, cannot be read or does not contain a decodable image, the default icon
    is returned. Callers cannot tell these cases apart.
*/

/*!
    Constructs a resolver that falls back to the image at \a defaultIconPath.
    If that image cannot be loaded either, a generated placeholder is used.
*/
IconResolver::IconResolver(const QString &defaultIconPath)
    : m_defaultIcon(defaultIconPath)
{
    if (m_defaultIcon.isNull()) {
        qCWarning(lcIcon) << "Cannot load default icon" << defaultIconPath << "- using placeholder.";
        m_defaultIcon = placeholderIcon();
    }
}

/*!
    Returns the image stored at \a topIconPath, or the default icon.
*/
QImage IconResolver::resolve(const std::optional<QString> &topIconPath) const
{
    if (!topIconPath || topIconPath->isEmpty())
        return m_defaultIcon;

    const QString path = *topIconPath;
    if (!QFileInfo(path).isFile()) {
        qCDebug(lcIcon) << "Icon file" << path << "does not exist.";
        return m_defaultIcon;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCDebug(lcIcon) << "Cannot read icon file" << path << ":" << file.errorString();
        return m_defaultIcon;
    }

    QImage image;
    if (!image.loadFromData(file.readAll())) {
        qCDebug(lcIcon) << "Icon file" << path << "does not contain a valid image.";
        return m_defaultIcon;
    }
    return image;
}

QImage IconResolver::placeholderIcon()
{
    QImage image(64, 64, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0x41, 0xcd, 0x52));
    painter.drawEllipse(image.rect().adjusted(4, 4, -4, -4));
    return image;
}

} // namespace Onboarding
