#include <QtCore/QCoreApplication>
#include <QtCore/QCommandLineParser>
#include <QtCore/QTextStream>
#include <exception>

#include "core/common/Logger.hpp"
#include "core/common/Config.hpp"
#include "cli/CheckCommand.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("repoguard-check");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("RepoGuard");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Validates one value the way the repository client does before using it.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("kind", "One of: " + RepoGuard::CheckCommand::kinds().join(", "));
    parser.addPositionalArgument("value", "The value to validate (any JSON value for 'metadata').");

    QCommandLineOption platformOption("target-platform",
        "File-name rules to apply: posix or windows.", "platform");
    QCommandLineOption levelOption("log-level",
        "trace, debug, info, warn, error or critical.", "level");
    parser.addOption(platformOption);
    parser.addOption(levelOption);

    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.size() != 2) {
        err << parser.helpText();
        return RepoGuard::CheckCommand::UsageError;
    }

    try {
        auto& config = RepoGuard::Config::instance();
        config.initialize();

        auto logging = config.getLoggingSettings();
        if (parser.isSet(levelOption)) {
            logging.level = RepoGuard::Logger::parseLevel(
                parser.value(levelOption).toStdString(), logging.level);
        }
        RepoGuard::Logger::instance().initialize(logging.filePath.toStdString(), logging.level);

        RepoGuard::TargetPlatform platform = config.getValidationSettings().targetPlatform;
        if (parser.isSet(platformOption)) {
            const auto parsed = RepoGuard::CheckCommand::parseTargetPlatform(parser.value(platformOption));
            if (!parsed) {
                err << "usage error: " << parsed.error() << Qt::endl;
                return RepoGuard::CheckCommand::UsageError;
            }
            platform = parsed.value();
        }

        const RepoGuard::CheckCommand command(platform);
        return command.run(arguments.at(0), arguments.at(1), out, err);

    } catch (const std::exception& e) {
        err << "fatal: " << e.what() << Qt::endl;
        return 3;
    }
}
