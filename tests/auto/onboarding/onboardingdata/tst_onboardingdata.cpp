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

#include <errors.h>
#include <onboardingdata.h>

#include <QBuffer>
#include <QDir>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QTest>

using namespace Onboarding;

static QByteArray pngBytes()
{
    QImage image(8, 8, QImage::Format_ARGB32);
    image.fill(Qt::blue);
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");
    return bytes;
}

class tst_OnboardingData : public QObject
{
    Q_OBJECT

private slots:
    void testReadFullDocument()
    {
        const QByteArray json = "{ \"pages\": ["
            "{ \"title\": \"Welcome\", \"subtitle\": \"Hello\", \"body\": \"**Bold** text\","
            "  \"icon\": \"/no/such/icon.png\","
            "  \"infoSection\": { \"fields\": ["
            "    { \"label\": \"Version\", \"description\": \"1.0\" },"
            "    { \"label\": \"Vendor\", \"description\": \"ACME\" } ] } },"
            "{ \"body\": \"Second page\" } ] }";

        const OnboardingData data = OnboardingData::fromJson(json);
        QCOMPARE(data.pageCount(), 2);

        const OnboardingPage first = data.pages().at(0);
        QCOMPARE(first.title.value_or(QString()), QLatin1String("Welcome"));
        QCOMPARE(first.subtitle.value_or(QString()), QLatin1String("Hello"));
        QCOMPARE(first.body.value_or(QString()), QLatin1String("**Bold** text"));
        QCOMPARE(first.topIcon.value_or(QString()), QLatin1String("/no/such/icon.png"));
        QVERIFY(!first.media);
        QVERIFY(first.infoSection.has_value());
        QCOMPARE(first.infoSection->fields.count(), 2);
        QCOMPARE(first.infoSection->fields.at(1).label, QLatin1String("Vendor"));
        QCOMPARE(first.infoSection->fields.at(1).description, QLatin1String("ACME"));

        const OnboardingPage second = data.pages().at(1);
        QVERIFY(!second.title);
        QVERIFY(!second.subtitle);
        QVERIFY(!second.topIcon);
        QVERIFY(!second.infoSection);
        QCOMPARE(second.body.value_or(QString()), QLatin1String("Second page"));
    }

    void testPageOrderIsKept()
    {
        const OnboardingData data = OnboardingData::fromJson("{ \"pages\": ["
            "{ \"title\": \"a\" }, { \"title\": \"b\" }, { \"title\": \"c\" } ] }");
        QCOMPARE(data.pageCount(), 3);
        QCOMPARE(*data.pages().at(0).title, QLatin1String("a"));
        QCOMPARE(*data.pages().at(1).title, QLatin1String("b"));
        QCOMPARE(*data.pages().at(2).title, QLatin1String("c"));
    }

    void testInvalidDocument_data()
    {
        QTest::addColumn<QByteArray>("json");
        QTest::addColumn<QString>("message");

        QTest::newRow("not json") << QByteArray("{ pages: ")
            << QString::fromLatin1("Cannot parse onboarding data in payload");
        QTest::newRow("array root") << QByteArray("[ 1, 2 ]")
            << QString::fromLatin1("Onboarding data in payload is not a JSON object.");
        QTest::newRow("missing pages") << QByteArray("{ \"title\": \"x\" }")
            << QString::fromLatin1("Missing \"pages\" array in payload.");
        QTest::newRow("empty pages") << QByteArray("{ \"pages\": [] }")
            << QString::fromLatin1("Onboarding data in payload contains no pages.");
        QTest::newRow("page not object") << QByteArray("{ \"pages\": [ 42 ] }")
            << QString::fromLatin1("Page 0 in payload is not a JSON object.");
        QTest::newRow("title not string") << QByteArray("{ \"pages\": [ { \"title\": 3 } ] }")
            << QString::fromLatin1("Unexpected value type for \"title\" in page 0.");
        QTest::newRow("info not object") << QByteArray("{ \"pages\": [ { \"infoSection\": \"x\" } ] }")
            << QString::fromLatin1("Unexpected value type for \"infoSection\" in page 0.");
    }

    void testInvalidDocument()
    {
        QFETCH(QByteArray, json);
        QFETCH(QString, message);

        try {
            OnboardingData::fromJson(json);
            QFAIL("Invalid onboarding data was accepted.");
        } catch (const Error &error) {
            QVERIFY2(error.message().startsWith(message), qPrintable(error.message()));
        }
    }

    void testUnknownKeysAreIgnored()
    {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QLatin1String("Unexpected key.*color")));
        const OnboardingData data = OnboardingData::fromJson(
            "{ \"pages\": [ { \"title\": \"x\", \"color\": \"red\" } ] }");
        QCOMPARE(data.pageCount(), 1);
        QCOMPARE(*data.pages().first().title, QLatin1String("x"));
    }

    void testEmptyInfoSectionIsDropped_data()
    {
        QTest::addColumn<QByteArray>("infoSection");
        QTest::addColumn<QString>("warning");

        QTest::newRow("missing fields") << QByteArray("{}")
            << QString::fromLatin1("Ignoring info section without.*fields.*array in page 0");
        QTest::newRow("fields not array") << QByteArray("{ \"fields\": \"none\" }")
            << QString::fromLatin1("Ignoring info section without.*fields.*array in page 0");
        QTest::newRow("no fields") << QByteArray("{ \"fields\": [] }")
            << QString::fromLatin1("Ignoring empty info section in page 0");
        QTest::newRow("empty rows") << QByteArray("{ \"fields\": [ {}, { \"label\": \"\" } ] }")
            << QString::fromLatin1("Ignoring empty info section in page 0");
    }

    void testEmptyInfoSectionIsDropped()
    {
        QFETCH(QByteArray, infoSection);
        QFETCH(QString, warning);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(warning));
        const OnboardingData data = OnboardingData::fromJson(
            "{ \"pages\": [ { \"title\": \"x\", \"infoSection\": " + infoSection + " } ] }");
        QVERIFY(!data.pages().first().infoSection);
    }

    void testNullValuesAreAbsent()
    {
        const OnboardingData data = OnboardingData::fromJson(
            "{ \"pages\": [ { \"title\": null, \"body\": \"b\" } ] }");
        QVERIFY(!data.pages().first().title);
        QVERIFY(data.pages().first().body);
    }

    void testFromPayload()
    {
        const QByteArray json = "{ \"pages\": [ { \"title\": \"Encoded\" } ] }";

        const OnboardingData plain = OnboardingData::fromPayload(QString::fromUtf8(json));
        QCOMPARE(*plain.pages().first().title, QLatin1String("Encoded"));

        const OnboardingData encoded = OnboardingData::fromPayload(QString::fromLatin1(json.toBase64()));
        QCOMPARE(*encoded.pages().first().title, QLatin1String("Encoded"));

        QVERIFY_EXCEPTION_THROWN(OnboardingData::fromPayload(QString()), Error);
        QVERIFY_EXCEPTION_THROWN(OnboardingData::fromPayload(QLatin1String("bm90IGpzb24=")), Error);
    }

    void testFromFile()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QString path = dir.filePath(QLatin1String("pages.json"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ \"pages\": [ { \"subtitle\": \"From file\" } ] }");
        file.close();

        const OnboardingData data = OnboardingData::fromFile(path);
        QCOMPARE(*data.pages().first().subtitle, QLatin1String("From file"));

        try {
            OnboardingData::fromFile(dir.filePath(QLatin1String("missing.json")));
            QFAIL("Reading a missing file succeeded.");
        } catch (const Error &error) {
            QVERIFY(error.message().startsWith(QLatin1String("Cannot open onboarding data file")));
        }
    }

    void testImageMedia()
    {
        const QByteArray png = pngBytes();

        const OnboardingMedia encoded = OnboardingData::mediaFromPayload(MediaKind::Image,
            QString::fromLatin1(png.toBase64()));
        QVERIFY(encoded.hasPayload());
        QCOMPARE(encoded.image.size(), QSize(8, 8));

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QLatin1String("image.png"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(png);
        file.close();

        QVERIFY(OnboardingData::mediaFromPayload(MediaKind::Image, path).hasPayload());
        QVERIFY(OnboardingData::mediaFromPayload(MediaKind::Image,
            QUrl::fromLocalFile(path).toString()).hasPayload());

        QVERIFY(!OnboardingData::mediaFromPayload(MediaKind::Image, QString()).hasPayload());
        QVERIFY(!OnboardingData::mediaFromPayload(MediaKind::Image,
            QLatin1String("bm90IGFuIGltYWdl")).hasPayload());
        QVERIFY(!OnboardingData::mediaFromPayload(MediaKind::Image,
            QLatin1String("https://example.com/image.png")).hasPayload());
    }

    void testVideoMedia()
    {
        const OnboardingMedia remote = OnboardingData::mediaFromPayload(MediaKind::Video,
            QLatin1String("https://example.com/intro.mp4"));
        QVERIFY(remote.hasPayload());
        QCOMPARE(remote.video, QUrl(QLatin1String("https://example.com/intro.mp4")));

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QLatin1String("clip.mp4"));
        QVERIFY(!OnboardingData::mediaFromPayload(MediaKind::Video, path).hasPayload());

        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("not really a video");
        file.close();

        const OnboardingMedia local = OnboardingData::mediaFromPayload(MediaKind::Video, path);
        QVERIFY(local.hasPayload());
        QVERIFY(local.video.isLocalFile());
    }

    void testMediaInDocument()
    {
        const QByteArray json = "{ \"pages\": ["
            "{ \"mediaType\": \"image\", \"mediaPayload\": \"" + pngBytes().toBase64() + "\" },"
            "{ \"mediaType\": \"video\", \"mediaPayload\": \"https://example.com/v.mp4\" },"
            "{ \"mediaType\": \"image\" },"
            "{ \"mediaType\": \"audio\", \"mediaPayload\": \"x\" } ] }";

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QLatin1String("unknown media type")));
        const OnboardingData data = OnboardingData::fromJson(json);
        QCOMPARE(data.pageCount(), 4);

        QVERIFY(data.pages().at(0).media);
        QVERIFY(data.pages().at(0).media->kind == MediaKind::Image);
        QVERIFY(data.pages().at(0).media->hasPayload());

        QVERIFY(data.pages().at(1).media);
        QVERIFY(data.pages().at(1).media->kind == MediaKind::Video);
        QVERIFY(data.pages().at(1).media->hasPayload());

        // declared media without payload stays on the page, the layout skips it
        QVERIFY(data.pages().at(2).media);
        QVERIFY(!data.pages().at(2).media->hasPayload());

        QVERIFY(!data.pages().at(3).media);
    }
};

QTEST_GUILESS_MAIN(tst_OnboardingData)

#include "tst_onboardingdata.moc"
