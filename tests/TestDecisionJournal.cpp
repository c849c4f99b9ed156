#include "state/DecisionJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::path("test_logs/test_decision_journal.jsonl");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        zonerisk::state::DecisionJournalJsonl journal(path);

        zonerisk::state::DecisionEvent first;
        first.ts_ms = 1000;
        first.symbol = "BTCUSDT";
        first.outcome = "ACCEPTED";
        first.payload["tp_price"] = 77922.0;

        zonerisk::state::DecisionEvent second;
        second.ts_ms = 2000;
        second.symbol = "BTCUSDT";
        second.outcome = "REJECTED";
        second.reason_code = "RR_BELOW_MINIMUM";
        second.payload["risk_reward"] = 0.616;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }

        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().reason_code != "RR_BELOW_MINIMUM" || rows.front().outcome != "REJECTED") {
            std::cerr << "[TEST] unexpected row: " << rows.front().outcome << "/" << rows.front().reason_code << "\n";
            return 1;
        }
        if (rows.front().payload.value("risk_reward", 0.0) != 0.616) {
            std::cerr << "[TEST] payload not preserved\n";
            return 1;
        }
    }

    // Sequence continues after a restart, malformed lines are skipped
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "{broken\n";
    }
    {
        zonerisk::state::DecisionJournalJsonl journal(path);
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] reopened lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        zonerisk::state::DecisionEvent third;
        third.ts_ms = 3000;
        third.symbol = "ETHUSDT";
        third.outcome = "STALE";
        third.reason_code = "STALE_SNAPSHOT";
        if (!journal.append(third)) {
            std::cerr << "[TEST] append(third) failed\n";
            return 1;
        }

        const auto rows = journal.readFrom(1);
        if (rows.size() != 3 || rows.back().seq != 3 || rows.back().symbol != "ETHUSDT") {
            std::cerr << "[TEST] expected 3 rows ending with seq 3\n";
            return 1;
        }
    }

    // Valid JSON of the wrong shape is skipped like a parse failure
    const auto odd_path = std::filesystem::path("test_logs/test_decision_journal_shapes.jsonl");
    {
        std::filesystem::create_directories(odd_path.parent_path(), ec);
        std::ofstream out(odd_path, std::ios::binary | std::ios::trunc);
        out << R"({"seq":1,"outcome":"ACCEPTED"})" << "\n";
        out << "[1,2]\n";
        out << R"({"seq":"x"})" << "\n";
        out << R"({"seq":2,"ts_ms":"late"})" << "\n";
    }
    {
        zonerisk::state::DecisionJournalJsonl journal(odd_path);
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq over mixed shapes should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }
        const auto rows = journal.readFrom(1);
        if (rows.size() != 1 || rows.front().seq != 1 || rows.front().outcome != "ACCEPTED") {
            std::cerr << "[TEST] expected only the well-formed row, got " << rows.size() << "\n";
            return 1;
        }
    }
    std::filesystem::remove(odd_path, ec);

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] DecisionJournal PASSED\n";
    return 0;
}
