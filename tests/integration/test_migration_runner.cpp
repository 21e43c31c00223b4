// Integration tests for a full migration over a state directory
// Coverage: discovery, skipped stores, re-run stability, dry-run/apply parity

#include <QtTest>

#include "common/test_base.h"

#include "ptrcanon/migrate/Runner.hpp"

using ptrcanon::canon::ConsentLevel;
using ptrcanon::migrate::MigrationOptions;
using ptrcanon::migrate::MigrationReport;
using ptrcanon::migrate::MigrationRunner;

namespace fs = std::filesystem;

class TestMigrationRunner : public TestBase
{
    Q_OBJECT

private:
    fs::path m_extraJson;

    void seedStateDirectory() {
        const fs::path main = createMemoryStore("memory.sqlite");
        insertRecord(main, {"m1", std::string(R"({"pointer":"<@AGENT:x>"})"), std::nullopt, std::nullopt,
                            std::nullopt});
        insertRecord(main, {"m2", std::string("ok"), std::nullopt, std::nullopt, std::nullopt});

        const fs::path nested = createMemoryStore("projects/alpha/cache/memory.sqlite");
        insertRecord(nested, {"n1", std::nullopt, std::string("from <@Feed:1>"), std::nullopt, std::nullopt});
        insertRecord(nested, {"n2", std::nullopt, std::nullopt, std::string(R"({"domain":"LOUD.example"})"),
                              std::nullopt});
        insertRecord(nested, {"n3", std::string(R"({"pointer":"<@bot:x>","consent":"private"})"), std::nullopt,
                              std::nullopt, std::nullopt});

        // Not a row-store extension: never opened.
        const fs::path ignored = createMemoryStore("legacy/memory.db");
        insertRecord(ignored, {"i1", std::string("<@IGNORED:1>"), std::nullopt, std::nullopt, std::nullopt});

        writeStateFile("broken.sqlite", std::string(4096, 'x'));

        writeStateFile("config/agents.json", R"({"pointer": "<@Agent:7>", "domain": "Agents.Example"})");
        writeStateFile("config/nested/clean.json", R"({"pointer": "<@agent:7>"})");
        writeStateFile("config/nested/links.json", R"(["see <@Doc:readme>"])");
        writeStateFile("config/readme.txt", "<@NOT:json-ext>");
        writeStateFile("notes.json", R"({"ref": "<@Outside:config>"})");

        m_extraJson = writeStateFile("extra/overrides.json", R"({"target": "<@EXTRA:1>"})");
    }

    MigrationOptions optionsFor(bool dryRun) const {
        MigrationOptions options;
        options.stateDir = statePath();
        options.dryRun = dryRun;
        options.defaultConsent = ConsentLevel::Private;
        options.extraJson = {m_extraJson, statePath("config/agents.json")};
        return options;
    }

private slots:
    void test_discovers_row_stores_by_extension() {
        seedStateDirectory();
        const MigrationRunner runner(optionsFor(true));
        const auto stores = runner.discoverStores();
        QCOMPARE(stores, (std::vector<fs::path>{statePath("broken.sqlite"), statePath("memory.sqlite"),
                                                 statePath("projects/alpha/cache/memory.sqlite")}));
    }

    void test_discovers_config_json_once() {
        seedStateDirectory();
        const MigrationRunner runner(optionsFor(true));
        const auto files = runner.discoverJsonFiles();
        QCOMPARE(files, (std::vector<fs::path>{m_extraJson, statePath("config/agents.json"),
                                                statePath("config/nested/clean.json"),
                                                statePath("config/nested/links.json")}));
    }

    void test_dry_run_reports_without_writing() {
        seedStateDirectory();
        const std::string before = readFile(statePath("config/agents.json"));

        const MigrationReport report = MigrationRunner(optionsFor(true)).run();
        QCOMPARE(report.changedRecords, 3);
        QCOMPARE(report.changedFiles, 3);
        QCOMPARE(report.storesScanned, 3);
        QCOMPARE(report.storesSkipped, 1);
        QCOMPARE(report.filesFailed, 0);

        QCOMPARE(readFile(statePath("config/agents.json")), before);
        QCOMPARE(readColumn(statePath("memory.sqlite"), "m1", "value"),
                 std::optional<std::string>(R"({"pointer":"<@AGENT:x>"})"));
    }

    void test_apply_matches_dry_run_and_rerun_is_clean() {
        seedStateDirectory();
        const MigrationReport preview = MigrationRunner(optionsFor(true)).run();
        const MigrationReport applied = MigrationRunner(optionsFor(false)).run();
        QCOMPARE(applied.changedRecords, preview.changedRecords);
        QCOMPARE(applied.changedFiles, preview.changedFiles);

        const MigrationReport again = MigrationRunner(optionsFor(false)).run();
        QCOMPARE(again.changedRecords, 0);
        QCOMPARE(again.changedFiles, 0);
        QCOMPARE(again.storesSkipped, 1);
    }

    void test_summary_names_both_totals() {
        seedStateDirectory();
        QTest::ignoreMessage(QtInfoMsg, "dry-run complete; would update 3 record(s) and 3 JSON file(s)");
        MigrationRunner(optionsFor(true)).run();

        QTest::ignoreMessage(QtInfoMsg, "migration complete; updated 3 record(s) and 3 JSON file(s)");
        MigrationRunner(optionsFor(false)).run();
    }

    void test_apply_writes_canonical_content() {
        seedStateDirectory();
        MigrationRunner(optionsFor(false)).run();

        QCOMPARE(readColumn(statePath("memory.sqlite"), "m1", "value"),
                 std::optional<std::string>(R"({"consent": "private", "pointer": "<@agent:x>"})"));
        QCOMPARE(readColumn(statePath("projects/alpha/cache/memory.sqlite"), "n1", "extra"),
                 std::optional<std::string>("from <@feed:1>"));
        QCOMPARE(readColumn(statePath("projects/alpha/cache/memory.sqlite"), "n2", "links"),
                 std::optional<std::string>(R"({"domain": "loud.example"})"));
        QCOMPARE(readColumn(statePath("legacy/memory.db"), "i1", "value"),
                 std::optional<std::string>("<@IGNORED:1>"));

        QCOMPARE(readFile(statePath("config/agents.json")),
                 std::string("{\"consent\": \"private\", \"domain\": \"agents.example\", \"pointer\": \"<@agent:7>\"}\n"));
        QCOMPARE(readFile(statePath("config/nested/links.json")), std::string("[\"see <@doc:readme>\"]\n"));
        QCOMPARE(readFile(statePath("config/nested/clean.json")), std::string(R"({"pointer": "<@agent:7>"})"));
        QCOMPARE(readFile(statePath("config/readme.txt")), std::string("<@NOT:json-ext>"));
        QCOMPARE(readFile(statePath("notes.json")), std::string(R"({"ref": "<@Outside:config>"})"));
        QCOMPARE(readFile(m_extraJson), std::string("{\"target\": \"<@extra:1>\"}\n"));
    }

    void test_missing_state_directory_completes() {
        MigrationOptions options;
        options.stateDir = statePath("does-not-exist");
        const MigrationReport report = MigrationRunner(options).run();
        QCOMPARE(report.changedRecords, 0);
        QCOMPARE(report.changedFiles, 0);
        QCOMPARE(report.storesScanned, 0);
    }

    void test_missing_extra_file_is_reported_not_fatal() {
        seedStateDirectory();
        MigrationOptions options = optionsFor(false);
        options.extraJson.push_back(statePath("extra/absent.json"));
        const MigrationReport report = MigrationRunner(options).run();
        QCOMPARE(report.filesFailed, 1);
        QCOMPARE(report.changedFiles, 3);
        QCOMPARE(report.changedRecords, 3);
    }
};

QTEST_MAIN(TestMigrationRunner)
#include "test_migration_runner.moc"
