#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QString>

namespace RepoGuard {

// Filesystem rule set a file name is checked against. Independent of the host OS
// so Windows rules can be exercised from a Linux build and vice versa.
enum class TargetPlatform {
    Posix,
    Windows
};

inline TargetPlatform hostPlatform() {
#ifdef Q_OS_WIN
    return TargetPlatform::Windows;
#else
    return TargetPlatform::Posix;
#endif
}

inline QString targetPlatformToString(TargetPlatform platform) {
    return platform == TargetPlatform::Windows ? QStringLiteral("windows") : QStringLiteral("posix");
}

// Unknown names yield the host platform
inline TargetPlatform targetPlatformFromString(const QString& name) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == QLatin1String("windows")) {
        return TargetPlatform::Windows;
    }
    if (lowered == QLatin1String("posix") || lowered == QLatin1String("linux") ||
        lowered == QLatin1String("macos")) {
        return TargetPlatform::Posix;
    }
    return hostPlatform();
}

} // namespace RepoGuard
