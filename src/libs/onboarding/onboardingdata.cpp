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

#include "onboardingdata.h"

#include "constants.h"
#include "errors.h"
#include "globals.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace Onboarding {

static const QStringList scPossiblePageKeys {
    scTitle,
    scSubtitle,
    scBody,
    scMediaType,
    scMediaPayload,
    scIcon,
    scInfoSection
};

/*!
    \class Onboarding::OnboardingData
    \brief The OnboardingData class holds the ordered list of pages shown by the
    onboarding wizard.

    Pages are read from a JSON document of the form:

    \code
    { "pages": [ { "title": "...", "subtitle": "...", "body": "...",
                   "mediaType": "image", "mediaPayload": "...", "icon": "...",
                   "infoSection": { "fields": [ { "label": "...", "description": "..." } ] } } ] }
    \endcode

    Every page key is optional. Structural problems in the document throw an
    Onboarding::Error; a media payload that cannot be decoded does not.
*/

/*!
    Returns \c true if the media carries something that can be shown: a decoded
    image for image media, a valid location for video media.
*/
bool OnboardingMedia::hasPayload() const
{
    switch (kind) {
    case MediaKind::Image:
        return !image.isNull();
    case MediaKind::Video:
        return video.isValid();
    }
    return false;
}

static std::optional<QString> readString(const QJsonObject &object, const QString &key, int index)
{
    if (!object.contains(key) || object.value(key).isNull())
        return std::nullopt;

    const QJsonValue value = object.value(key);
    if (!value.isString()) {
        throw Error(OnboardingData::tr("Unexpected value type for \"%1\" in page %2.")
            .arg(key).arg(index));
    }
    return value.toString();
}

/*!
    Parses \a json into onboarding data. \a source names the origin of the document
    in error messages. Throws Onboarding::Error if the document is not valid JSON,
    has no \c pages array, or the array is empty.
*/
OnboardingData OnboardingData::fromJson(const QByteArray &json, const QString &source)
{
    const QString origin = source.isEmpty() ? tr("payload") : source;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw Error(tr("Cannot parse onboarding data in %1 at offset %2: %3")
            .arg(origin).arg(parseError.offset).arg(parseError.errorString()));
    }
    if (!doc.isObject())
        throw Error(tr("Onboarding data in %1 is not a JSON object.").arg(origin));

    const QJsonValue pagesValue = doc.object().value(scPages);
    if (!pagesValue.isArray())
        throw Error(tr("Missing \"%1\" array in %2.").arg(scPages, origin));

    const QJsonArray pages = pagesValue.toArray();
    if (pages.isEmpty())
        throw Error(tr("Onboarding data in %1 contains no pages.").arg(origin));

    OnboardingData data;
    int index = 0;
    for (const QJsonValue &value : pages) {
        if (!value.isObject())
            throw Error(tr("Page %1 in %2 is not a JSON object.").arg(index).arg(origin));
        data.m_pages.append(readPage(value.toObject(), index));
        ++index;
    }

    qCDebug(lcData) << "Read" << data.m_pages.count() << "onboarding pages from" << origin;
    return data;
}

/*!
    Reads onboarding data from the JSON file at \a path.
*/
OnboardingData OnboardingData::fromFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        throw Error(tr("Cannot open onboarding data file %1 for reading: %2").arg(path, file.errorString()));

    return fromJson(file.readAll(), path);
}

/*!
    Reads onboarding data from \a payload, which contains either the JSON document
    itself or its base64 encoding.
*/
OnboardingData OnboardingData::fromPayload(const QString &payload)
{
    const QString trimmed = payload.trimmed();
    if (trimmed.startsWith(QLatin1Char('{')))
        return fromJson(trimmed.toUtf8());

    const QByteArray decoded = QByteArray::fromBase64(trimmed.toLatin1());
    if (decoded.isEmpty())
        throw Error(tr("The payload is neither JSON nor base64 encoded JSON."));
    return fromJson(decoded);
}

/*!
    Resolves the media \a payload for a media element of type \a kind.

    An image payload can be a local path, a \c file: URL or base64 encoded image
    bytes. A video payload is any valid URL; local video files must exist. If the
    payload cannot be resolved the returned media has no payload.
*/
OnboardingMedia OnboardingData::mediaFromPayload(MediaKind kind, const QString &payload)
{
    OnboardingMedia media;
    media.kind = kind;
    if (payload.isEmpty())
        return media;

    if (kind == MediaKind::Video) {
        const QUrl url = QUrl::fromUserInput(payload, QString(), QUrl::AssumeLocalFile);
        if (url.isLocalFile() && !QFileInfo(url.toLocalFile()).isFile()) {
            qCDebug(lcData) << "Video file" << url.toLocalFile() << "does not exist.";
            return media;
        }
        media.video = url;
        return media;
    }

    const QUrl url(payload);
    if (QFileInfo(payload).isFile()) {
        media.image.load(payload);
    } else if (url.isLocalFile()) {
        media.image.load(url.toLocalFile());
    } else if (!url.scheme().isEmpty() && url.scheme().length() > 1) {
        qCDebug(lcData) << "Remote image payloads are not loaded:" << url.toString();
    } else {
        media.image.loadFromData(QByteArray::fromBase64(payload.toLatin1()));
    }

    if (media.image.isNull())
        qCDebug(lcData) << "Image payload could not be decoded.";
    return media;
}

OnboardingPage OnboardingData::readPage(const QJsonObject &object, int index)
{
    for (const QString &key : object.keys()) {
        if (!scPossiblePageKeys.contains(key))
            qCWarning(lcData) << "Unexpected key" << key << "in page" << index;
    }

    OnboardingPage page;
    page.title = readString(object, scTitle, index);
    page.subtitle = readString(object, scSubtitle, index);
    page.body = readString(object, scBody, index);
    page.topIcon = readString(object, scIcon, index);

    const std::optional<QString> mediaType = readString(object, scMediaType, index);
    const std::optional<QString> mediaPayload = readString(object, scMediaPayload, index);
    if (mediaType) {
        if (*mediaType == scImage) {
            page.media = mediaFromPayload(MediaKind::Image, mediaPayload.value_or(QString()));
        } else if (*mediaType == scVideo) {
            page.media = mediaFromPayload(MediaKind::Video, mediaPayload.value_or(QString()));
        } else {
            qCWarning(lcData) << "Ignoring unknown media type" << *mediaType << "in page" << index;
        }
    } else if (mediaPayload) {
        qCWarning(lcData) << "Ignoring media payload without media type in page" << index;
    }

    const QJsonValue info = object.value(scInfoSection);
    if (info.isObject()) {
        page.infoSection = readInfoSection(info.toObject(), index);
    } else if (!info.isUndefined() && !info.isNull()) {
        throw Error(tr("Unexpected value type for \"%1\" in page %2.").arg(scInfoSection).arg(index));
    }

    return page;
}

/*!
    Returns the help content of page \a index read from \a object, or no value
    if \a object holds no field with a label or a description.
*/
std::optional<InfoSection> OnboardingData::readInfoSection(const QJsonObject &object, int index)
{
    const QJsonValue fieldsValue = object.value(scFields);
    if (!fieldsValue.isArray()) {
        qCWarning(lcData) << "Ignoring info section without" << scFields << "array in page" << index;
        return std::nullopt;
    }

    InfoSection section;
    const QJsonArray fields = fieldsValue.toArray();
    for (const QJsonValue &value : fields) {
        const QJsonObject field = value.toObject();
        InfoField info;
        info.label = field.value(scLabel).toString();
        info.description = field.value(scDescription).toString();
        if (info.label.isEmpty() && info.description.isEmpty())
            continue;
        section.fields.append(info);
    }
    if (section.fields.isEmpty()) {
        qCWarning(lcData) << "Ignoring empty info section in page" << index;
        return std::nullopt;
    }
    return section;
}

} // namespace Onboarding
