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

#include "settings.h"

#include "constants.h"
#include "errors.h"
#include "globals.h"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtGui/QFontMetricsF>
#include <QtGui/QGuiApplication>

#include <QXmlStreamReader>

using namespace Onboarding;

/*!
    \class Onboarding::Settings
    \brief The Settings class holds the wizard configuration read from an XML
    file with an \c <Onboarding> root element.

    All elements are optional:

    \list
        \li \c WindowTitle: title of the wizard window.
        \li \c WizardDefaultWidth, \c WizardDefaultHeight: initial window size,
            in pixels or with \c px, \c em or \c ex units.
        \li \c DefaultIcon: fallback page icon, relative to the file's directory.
        \li \c Spacing: vertical gap between page elements.
        \li \c TitleColor: color of the page title.
    \endlist
*/

static const QLatin1String scPrefix("Prefix");

static void raiseError(QXmlStreamReader &reader, const QString &error, Settings::ParseMode parseMode)
{
    if (parseMode == Settings::StrictParseMode) {
        reader.raiseError(error);
    } else {
        QFile *xmlFile = qobject_cast<QFile*>(reader.device());
        if (xmlFile) {
            qCWarning(lcData).noquote().nospace()
                    << "Ignoring following settings reader error in " << xmlFile->fileName()
                                 << ", line " << reader.lineNumber() << ", column " << reader.columnNumber()
                                 << ": " << error;
        } else {
            qCWarning(lcData) << "Ignoring following settings reader error: "
                << qPrintable(error);
        }
    }
}

class Settings::Private : public QSharedData
{
public:
    QHash<QString, QVariant> m_data;

    QString absolutePathFromKey(const QString &key) const
    {
        const QString value = m_data.value(key).toString();
        if (value.isEmpty())
            return QString();

        if (QFileInfo(value).isAbsolute() || value.startsWith(QLatin1Char(':')))
            return value;
        return m_data.value(scPrefix).toString() + QLatin1String("/") + value;
    }
};


// -- Settings

Settings::Settings()
    : d(new Private)
{
}

Settings::~Settings()
{
}

Settings::Settings(const Settings &other)
    : d(other.d)
{
}

Settings& Settings::operator=(const Settings &other)
{
    Settings copy(other);
    std::swap(d, copy.d);
    return *this;
}

/* static */
Settings Settings::fromFile(const QString &path, ParseMode parseMode)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        throw Error(tr("Cannot open settings file %1 for reading: %2").arg(path, file.errorString()));

    QXmlStreamReader reader(&file);
    if (reader.readNextStartElement()) {
        if (reader.name() != scOnboarding) {
            reader.raiseError(QString::fromLatin1("Unexpected element \"%1\" as root element.").arg(reader
                .name().toString()));
        }
    }
    QStringList elementList;
    elementList << scWindowTitle << scWizardDefaultWidth << scWizardDefaultHeight
                << scDefaultIcon << scSpacing << scTitleColor;

    Settings s;
    s.d->m_data.insert(scPrefix, QFileInfo(path).absolutePath());
    while (!reader.hasError() && reader.readNextStartElement()) {
        const QString name = reader.name().toString();
        if (!elementList.contains(name)) {
            raiseError(reader, QString::fromLatin1("Unexpected element \"%1\".").arg(name), parseMode);
            if (!reader.hasError())
                reader.skipCurrentElement();
            continue;
        }

        if (!reader.attributes().isEmpty()) {
            raiseError(reader, QString::fromLatin1("Unexpected attribute for element \"%1\".").arg(name),
                parseMode);
        }

        if (s.d->m_data.contains(name))
            reader.raiseError(QString::fromLatin1("Element \"%1\" has been defined before.").arg(name));

        s.d->m_data.insert(name, reader.readElementText(QXmlStreamReader::SkipChildElements));
    }
    if (reader.error() != QXmlStreamReader::NoError) {
        throw Error(QString::fromLatin1("Error in %1, line %2, column %3: %4").arg(path).arg(reader
            .lineNumber()).arg(reader.columnNumber()).arg(reader.errorString()));
    }

    if (s.spacing() < 0)
        throw Error(QString::fromLatin1("Negative <Spacing> in %1.").arg(path));

    return s;
}

QString Settings::windowTitle() const
{
    return d->m_data.value(scWindowTitle, tr("Onboarding")).toString();
}

static int lengthToInt(const QVariant &variant)
{
    QString length = variant.toString().trimmed();
    if (length.endsWith(QLatin1String("em"), Qt::CaseInsensitive)) {
        length.chop(2);
        return qRound(length.toDouble() * QFontMetricsF(QGuiApplication::font()).height());
    }
    if (length.endsWith(QLatin1String("ex"), Qt::CaseInsensitive)) {
        length.chop(2);
        return qRound(length.toDouble() * QFontMetricsF(QGuiApplication::font()).xHeight());
    }
    if (length.endsWith(QLatin1String("px"), Qt::CaseInsensitive)) {
        length.chop(2);
    }
    return length.toInt();
}

int Settings::wizardDefaultWidth() const
{
    return lengthToInt(d->m_data.value(scWizardDefaultWidth, 780));
}

int Settings::wizardDefaultHeight() const
{
    return lengthToInt(d->m_data.value(scWizardDefaultHeight, 580));
}

QString Settings::defaultIcon() const
{
    if (!d->m_data.contains(scDefaultIcon))
        return scDefaultIconResource;
    return d->absolutePathFromKey(scDefaultIcon);
}

int Settings::spacing() const
{
    return lengthToInt(d->m_data.value(scSpacing, scDefaultSpacing));
}

QString Settings::titleColor() const
{
    return d->m_data.value(scTitleColor).toString();
}

bool Settings::containsValue(const QString &key) const
{
    return d->m_data.contains(key);
}

QVariant Settings::value(const QString &key, const QVariant &defaultValue) const
{
    return d->m_data.value(key, defaultValue);
}
