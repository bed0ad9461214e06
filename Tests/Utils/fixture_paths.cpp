#include "fixture_paths.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace rw::test {
namespace {

bool hasFixtureKnowledgeBase(const QString& dirPath)
{
    return QFileInfo::exists(QDir(dirPath).filePath(QStringLiteral("interventions.csv")));
}

QString findFixturesDirFrom(const QString& start)
{
    if (start.isEmpty()) {
        return QString();
    }

    QDir cursor(start);
    for (int depth = 0; depth < 14; ++depth) {
        const QString candidate =
            QDir::cleanPath(cursor.filePath(QStringLiteral("Tests/Fixtures")));
        if (hasFixtureKnowledgeBase(candidate)) {
            return candidate;
        }
        if (!cursor.cdUp()) {
            break;
        }
    }
    return QString();
}

} // namespace

QString fixturesDir()
{
    const QString explicitEnv = qEnvironmentVariable("ROADWISE_TEST_FIXTURES_DIR");
    if (!explicitEnv.isEmpty() && hasFixtureKnowledgeBase(explicitEnv)) {
        return QDir::cleanPath(explicitEnv);
    }

#ifdef ROADWISE_FIXTURES_DIR
    const QString configured = QStringLiteral(ROADWISE_FIXTURES_DIR);
    if (hasFixtureKnowledgeBase(configured)) {
        return QDir::cleanPath(configured);
    }
#endif

    const QString appCandidate =
        findFixturesDirFrom(QCoreApplication::applicationDirPath());
    if (!appCandidate.isEmpty()) {
        return appCandidate;
    }

    return findFixturesDirFrom(QDir::currentPath());
}

QString fixturePath(const QString& name)
{
    const QString dir = fixturesDir();
    if (dir.isEmpty()) {
        return QString();
    }
    return QDir(dir).filePath(name);
}

} // namespace rw::test
