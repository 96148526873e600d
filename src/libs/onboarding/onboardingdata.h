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

#ifndef ONBOARDINGDATA_H
#define ONBOARDINGDATA_H

#include "onboarding_global.h"

#include <QtCore/QCoreApplication>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtGui/QImage>

#include <optional>

QT_BEGIN_NAMESPACE
class QJsonObject;
QT_END_NAMESPACE

namespace Onboarding {

struct ONBOARDING_EXPORT InfoField
{
    QString label;
    QString description;
};

struct ONBOARDING_EXPORT InfoSection
{
    QList<InfoField> fields;
};

enum class MediaKind {
    Image,
    Video
};

struct ONBOARDING_EXPORT OnboardingMedia
{
    MediaKind kind = MediaKind::Image;
    QImage image;   // null when the image payload did not decode
    QUrl video;     // invalid when no playable location was given

    bool hasPayload() const;
};

struct ONBOARDING_EXPORT OnboardingPage
{
    std::optional<QString> title;
    std::optional<QString> subtitle;
    std::optional<QString> body;    // markdown
    std::optional<OnboardingMedia> media;
    std::optional<QString> topIcon;
    std::optional<InfoSection> infoSection;
};

class ONBOARDING_EXPORT OnboardingData
{
    Q_DECLARE_TR_FUNCTIONS(OnboardingData)

public:
    OnboardingData() = default;

    static OnboardingData fromJson(const QByteArray &json, const QString &source = QString());
    static OnboardingData fromFile(const QString &path);
    static OnboardingData fromPayload(const QString &payload);

    static OnboardingMedia mediaFromPayload(MediaKind kind, const QString &payload);

    QList<OnboardingPage> pages() const { return m_pages; }
    int pageCount() const { return m_pages.count(); }

private:
    static OnboardingPage readPage(const QJsonObject &object, int index);
    static std::optional<InfoSection> readInfoSection(const QJsonObject &object, int index);

private:
    QList<OnboardingPage> m_pages;
};

} // namespace Onboarding

#endif // ONBOARDINGDATA_H
