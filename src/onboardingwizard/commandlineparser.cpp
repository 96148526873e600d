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

#include "commandlineparser.h"

#include <globals.h>

CommandLineParser::CommandLineParser()
{
    m_parser.setApplicationDescription(QLatin1String("\nShows a paged onboarding wizard. The "
        "pages are read from a JSON document given either inline with --payload or as a file "
        "with --file."));

    m_parser.addHelpOption();
    m_parser.addOption(QCommandLineOption(CommandLineOptions::scVersionLong,
        QLatin1String("Displays version information.")));

    m_parser.addOption(QCommandLineOption(QStringList()
        << CommandLineOptions::scVerboseShort << CommandLineOptions::scVerboseLong,
        QLatin1String("Verbose mode. Prints out more information. The following logging "
        "categories are available:\n") + Onboarding::loggingCategories().join(QLatin1Char('\n'))));

    m_parser.addOption(QCommandLineOption(CommandLineOptions::scPayloadLong,
        QLatin1String("Onboarding document as JSON text or base64 encoded JSON."),
        QLatin1String("payload")));

    m_parser.addOption(QCommandLineOption(QStringList()
        << CommandLineOptions::scFileShort << CommandLineOptions::scFileLong,
        QLatin1String("Reads the onboarding document from a JSON file."), QLatin1String("file")));

    m_parser.addOption(QCommandLineOption(QStringList()
        << CommandLineOptions::scConfigShort << CommandLineOptions::scConfigLong,
        QLatin1String("Reads the wizard configuration from an XML file."), QLatin1String("file")));

    m_parser.addOption(QCommandLineOption(CommandLineOptions::scRelaxedLong,
        QLatin1String("Ignores unknown elements in the configuration file instead of failing.")));
}

/*!
    Returns a message describing why the parsed arguments cannot start the
    wizard, or an empty string if they can.
*/
QString CommandLineParser::sanityMessage() const
{
    const bool payload = isSet(CommandLineOptions::scPayloadLong);
    const bool file = isSet(CommandLineOptions::scFileLong);
    if (payload && file) {
        return QString::fromLatin1("The following options are mutually exclusive: %1, %2.")
            .arg(CommandLineOptions::scPayloadLong, CommandLineOptions::scFileLong);
    }
    if (!payload && !file) {
        return QString::fromLatin1("One of the options --%1 or --%2 is required.")
            .arg(CommandLineOptions::scPayloadLong, CommandLineOptions::scFileLong);
    }
    if (!positionalArguments().isEmpty()) {
        return QString::fromLatin1("Unexpected argument \"%1\".")
            .arg(positionalArguments().first());
    }
    return QString();
}
