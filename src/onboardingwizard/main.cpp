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

#include <errors.h>
#include <loggingutils.h>
#include <navigation.h>
#include <onboardingdata.h>
#include <onboardingwizard.h>
#include <settings.h>

#include <QApplication>

#include <iostream>

#define QUOTE_(x) #x
#define QUOTE(x) QUOTE_(x)
#define VERSION "Onboarding Wizard Version: " QUOTE(ONBOARDING_VERSION_STR) ", built with Qt " QT_VERSION_STR "."
#define BUILDDATE "Build date: " __DATE__

int main(int argc, char *argv[])
{
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
    if (!qEnvironmentVariableIsSet("QT_AUTO_SCREEN_SCALE_FACTOR")
            && !qEnvironmentVariableIsSet("QT_SCALE_FACTOR")
            && !qEnvironmentVariableIsSet("QT_SCREEN_SCALE_FACTORS")) {
        QCoreApplication::setAttribute(Qt::AA_EnableHighDpiScaling);
    }
#endif

    QStringList arguments;
    for (int i = 0; i < argc; ++i)
        arguments.append(QString::fromLocal8Bit(argv[i]));

    CommandLineParser parser;
    if (!parser.parse(arguments)) {
        std::cerr << qPrintable(parser.errorText()) << std::endl;
        return EXIT_FAILURE;
    }

    const bool help = parser.isSet(CommandLineOptions::scHelpLong);
    if (help || parser.isSet(CommandLineOptions::scVersionLong)) {
        if (parser.isSet(CommandLineOptions::scVersionLong)) {
            std::cout << VERSION << std::endl << BUILDDATE << std::endl;
            return EXIT_SUCCESS;
        }
        std::cout << qPrintable(parser.helpText()) << std::endl;
        return EXIT_SUCCESS;
    }

    const QString sanityMessage = parser.sanityMessage();
    if (!sanityMessage.isEmpty()) {
        std::cout << qPrintable(parser.helpText()) << std::endl;
        std::cerr << qPrintable(sanityMessage) << std::endl;
        return EXIT_FAILURE;
    }

    QApplication app(argc, argv);
    QApplication::setApplicationName(QLatin1String("onboardingwizard"));
    QApplication::setApplicationVersion(QLatin1String(QUOTE(ONBOARDING_VERSION_STR)));

    Onboarding::installMessageHandler();
    // verbose level can be increased by setting the verbose option multiple times
    foreach (const QString &name, parser.optionNames()) {
        if (name == CommandLineOptions::scVerboseShort || name == CommandLineOptions::scVerboseLong)
            Onboarding::LoggingHandler::instance().setVerbose(true);
    }

    try {
        Onboarding::Settings settings;
        if (parser.isSet(CommandLineOptions::scConfigLong)) {
            settings = Onboarding::Settings::fromFile(parser.value(CommandLineOptions::scConfigLong),
                parser.isSet(CommandLineOptions::scRelaxedLong)
                    ? Onboarding::Settings::RelaxedParseMode
                    : Onboarding::Settings::StrictParseMode);
        }

        const Onboarding::OnboardingData data = parser.isSet(CommandLineOptions::scPayloadLong)
            ? Onboarding::OnboardingData::fromPayload(parser.value(CommandLineOptions::scPayloadLong))
            : Onboarding::OnboardingData::fromFile(parser.value(CommandLineOptions::scFileLong));

        Onboarding::ApplicationExit applicationExit;
        Onboarding::OnboardingWizard wizard(data, settings, &applicationExit);
        wizard.show();
        return app.exec();
    } catch (const Onboarding::Error &e) {
        std::cerr << qPrintable(e.message()) << std::endl;
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
    }

    return EXIT_FAILURE;
}
