#include <QtTest/QtTest>

#include "core/ranking/similarity.h"

#include <cmath>

class TestSimilarity : public QObject {
    Q_OBJECT

private slots:
    void testEditDistanceBasics();
    void testTranspositionCountsOnce();
    void testEarlyExitCap();
    void testTokenSimilarityNormalized();
    void testFlooredSimilarity();
};

void TestSimilarity::testEditDistanceBasics()
{
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("curve"), QStringLiteral("curve"), 3), 0);
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("sign"), QStringLiteral("signs"), 3), 1);
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("kitten"), QStringLiteral("sitting"), 5), 3);
    QCOMPARE(rw::Similarity::editDistance(QString(), QStringLiteral("fog"), 5), 3);
}

void TestSimilarity::testTranspositionCountsOnce()
{
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("curve"), QStringLiteral("cruve"), 3), 1);
    // Restricted variant: no edits inside a transposed pair.
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("ca"), QStringLiteral("abc"), 5), 3);
}

void TestSimilarity::testEarlyExitCap()
{
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("guardrail"), QStringLiteral("fog"), 2), 3);
    QCOMPARE(rw::Similarity::editDistance(QStringLiteral("barrier"), QStringLiteral("chevron"), 1), 2);
}

void TestSimilarity::testTokenSimilarityNormalized()
{
    QCOMPARE(rw::Similarity::tokenSimilarity(QStringLiteral("curve"), QStringLiteral("curve")), 1.0);
    QCOMPARE(rw::Similarity::tokenSimilarity(QString(), QString()), 1.0);
    QVERIFY(std::abs(rw::Similarity::tokenSimilarity(QStringLiteral("sign"),
                                                     QStringLiteral("signs")) - 0.8) < 1e-9);
    QVERIFY(std::abs(rw::Similarity::tokenSimilarity(QStringLiteral("chevron"),
                                                     QStringLiteral("chevrons")) - 0.875) < 1e-9);
    QCOMPARE(rw::Similarity::tokenSimilarity(QStringLiteral("fog"), QStringLiteral("xyz")), 0.0);
}

void TestSimilarity::testFlooredSimilarity()
{
    QVERIFY(rw::Similarity::flooredSimilarity(QStringLiteral("accident"),
                                              QStringLiteral("accidents"), 0.75) > 0.85);
    QCOMPARE(rw::Similarity::flooredSimilarity(QStringLiteral("signal"),
                                               QStringLiteral("signs"), 0.75), 0.0);
    QCOMPARE(rw::Similarity::flooredSimilarity(QStringLiteral("blind"),
                                               QStringLiteral("black"), 0.75), 0.0);
    // Exactly on the floor is not a match.
    QCOMPARE(rw::Similarity::tokenSimilarity(QStringLiteral("load"), QStringLiteral("road")), 0.75);
    QCOMPARE(rw::Similarity::flooredSimilarity(QStringLiteral("load"),
                                               QStringLiteral("road"), 0.75), 0.0);
}

QTEST_MAIN(TestSimilarity)
#include "test_similarity.moc"
