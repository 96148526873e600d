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

#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <QtCore/QString>

namespace Onboarding {

// onboarding data keys
static const QLatin1String scPages("pages");
static const QLatin1String scTitle("title");
static const QLatin1String scSubtitle("subtitle");
static const QLatin1String scBody("body");
static const QLatin1String scMediaType("mediaType");
static const QLatin1String scMediaPayload("mediaPayload");
static const QLatin1String scIcon("icon");
static const QLatin1String scInfoSection("infoSection");
static const QLatin1String scFields("fields");
static const QLatin1String scLabel("label");
static const QLatin1String scDescription("description");

static const QLatin1String scImage("image");
static const QLatin1String scVideo("video");

// configuration elements
static const QLatin1String scOnboarding("Onboarding");
static const QLatin1String scWindowTitle("WindowTitle");
static const QLatin1String scWizardDefaultWidth("WizardDefaultWidth");
static const QLatin1String scWizardDefaultHeight("WizardDefaultHeight");
static const QLatin1String scDefaultIcon("DefaultIcon");
static const QLatin1String scSpacing("Spacing");
static const QLatin1String scTitleColor("TitleColor");

static const QLatin1String scDefaultIconResource(":/onboarding/images/default_icon.png");

// vertical gap between stacked page elements
static const int scDefaultSpacing = 12;

} // namespace Onboarding

#endif // CONSTANTS_H
