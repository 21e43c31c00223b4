#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QStringList>

#include "ptrcanon/canon/Consent.hpp"
#include "ptrcanon/migrate/Options.hpp"
#include "ptrcanon/migrate/Runner.hpp"

#include <cstdio>
#include <utility>

Q_LOGGING_CATEGORY(ptrcanonMain, "ptrcanon.main")

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ptrcanon-migrate");
    app.setApplicationVersion("1.0.0");

    qSetMessagePattern("[%{type}] %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Canonicalise pointer tokens in state and config files.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption stateDirOption(
        "state-dir",
        QString("Path to the state directory (defaults to %1 or ./state).").arg(QString::fromLatin1(ptrcanon::migrate::kStateDirEnv)),
        "dir");
    const QCommandLineOption dryRunOption("dry-run", "Analyse and report changes without writing them.");
    const QCommandLineOption consentOption(
        "default-consent",
        "Consent level to inject when pointer records lack explicit consent: private, shared or public.",
        "level", "private");
    const QCommandLineOption extraJsonOption(
        "extra-json", "Additional JSON file to canonicalise. May be repeated.", "file");
    const QCommandLineOption verboseOption("verbose", "Enable debug logging.");
    parser.addOptions({stateDirOption, dryRunOption, consentOption, extraJsonOption, verboseOption});
    parser.process(app);

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? "ptrcanon.*=true"
                                                                 : "ptrcanon.*.debug=false\nptrcanon.*.info=true");

    const auto consent = ptrcanon::canon::parseConsentLevel(parser.value(consentOption).toStdString());
    if (!consent) {
        std::fprintf(stderr, "%s: invalid --default-consent '%s' (choose private, shared or public)\n",
                     qPrintable(app.applicationName()), qPrintable(parser.value(consentOption)));
        return 2;
    }

    ptrcanon::migrate::MigrationOptions options;
    options.stateDir = ptrcanon::migrate::resolveStateDir(parser.value(stateDirOption));
    options.dryRun = parser.isSet(dryRunOption);
    options.defaultConsent = *consent;
    for (const QString& extra : parser.values(extraJsonOption)) {
        options.extraJson.emplace_back(extra.toStdString());
    }

    qCDebug(ptrcanonMain, "State directory: %s (%s, default consent %s)", options.stateDir.string().c_str(),
            options.dryRun ? "dry-run" : "apply", ptrcanon::canon::toString(options.defaultConsent));

    const ptrcanon::migrate::MigrationRunner runner(std::move(options));
    const ptrcanon::migrate::MigrationReport report = runner.run();
    if (report.storesSkipped > 0 || report.filesFailed > 0) {
        qCWarning(ptrcanonMain, "%d store(s) and %d file(s) were skipped; re-run after fixing them",
                  report.storesSkipped, report.filesFailed);
    }
    return 0;
}
