#include "TestUtils.hpp"
#include "../../src/core/common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QtGlobal>

namespace RepoGuard {
namespace Test {

void TestUtils::initializeTestEnvironment() {
    REPOGUARD_INFO("Test environment initialized");
}

void TestUtils::cleanupTestEnvironment() {
    REPOGUARD_INFO("Test environment cleaned up");
}

QString TestUtils::createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename) {
    const QString path = QDir(directory).filePath(filename);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        REPOGUARD_ERROR("Cannot create test file {}", path.toStdString());
        return QString();
    }
    file.write(content.toUtf8());
    file.close();
    return QFileInfo(path).absoluteFilePath();
}

QString TestUtils::withControlCharacter(const QString& prefix, ushort code, const QString& suffix) {
    return prefix + QChar(code) + suffix;
}

ScopedEnvironment::~ScopedEnvironment() {
    // Restore in reverse so a variable touched twice ends at its original value
    for (auto it = saved_.crbegin(); it != saved_.crend(); ++it) {
        if (it->wasSet) {
            qputenv(it->name.constData(), it->value);
        } else {
            qunsetenv(it->name.constData());
        }
    }
}

void ScopedEnvironment::remember(const char* name) {
    saved_.append({QByteArray(name), qEnvironmentVariableIsSet(name), qgetenv(name)});
}

void ScopedEnvironment::set(const char* name, const QByteArray& value) {
    remember(name);
    qputenv(name, value);
}

void ScopedEnvironment::unset(const char* name) {
    remember(name);
    qunsetenv(name);
}

} // namespace Test
} // namespace RepoGuard
