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

#ifndef ERRORS_H
#define ERRORS_H

#include "onboarding_global.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <exception>

namespace Onboarding {

class ONBOARDING_EXPORT Error : public std::exception
{
public:
    Error() {}
    explicit Error(const QString &message)
        : m_message(message)
    {}
    virtual ~Error() noexcept {}

    QString message() const { return m_message; }

    const char *what() const noexcept override
    {
        m_bytes = m_message.toLocal8Bit();
        return m_bytes.constData();
    }

private:
    QString m_message;
    mutable QByteArray m_bytes;
};

}   // namespace Onboarding

#endif  // ERRORS_H
