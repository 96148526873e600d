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

#ifndef COMMANDLINEPARSER_H
#define COMMANDLINEPARSER_H

#include <QCommandLineParser>

namespace CommandLineOptions {

static const QLatin1String scHelpShort("h");
static const QLatin1String scHelpLong("help");
static const QLatin1String scVersionLong("version");
static const QLatin1String scVerboseShort("v");
static const QLatin1String scVerboseLong("verbose");
static const QLatin1String scPayloadLong("payload");
static const QLatin1String scFileShort("f");
static const QLatin1String scFileLong("file");
static const QLatin1String scConfigShort("c");
static const QLatin1String scConfigLong("config");
static const QLatin1String scRelaxedLong("relaxed");

} // namespace CommandLineOptions

class CommandLineParser
{
public:
    CommandLineParser();

    QString helpText() const { return m_parser.helpText(); }
    QString errorText() const { return m_parser.errorText(); }
    bool isSet(const QString &option) const { return m_parser.isSet(option); }
    bool parse(const QStringList &arguments) { return m_parser.parse(arguments); }
    QString value(const QString &option) const { return m_parser.value(option); }
    QStringList optionNames() const { return m_parser.optionNames(); }
    QStringList positionalArguments() const { return m_parser.positionalArguments(); }

    QString sanityMessage() const;

private:
    QCommandLineParser m_parser;
};

#endif // COMMANDLINEPARSER_H
