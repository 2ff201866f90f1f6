#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <canlog/canlog.hpp>

using namespace CanLog;

// =============================================================================
// Helper Macros for Output
// =============================================================================

#define SECTION(name) std::cout << "\n=== " << name << " ===\n"
#define CHECK_EC(ec, context)                                                                      \
    if (ec) {                                                                                      \
        std::cerr << "[FAIL] " << context << ": " << ec.message() << "\n";                         \
        return 1;                                                                                  \
    }

static void printRecord(const MessageRecord& rec) {
    std::cout << std::fixed << std::setprecision(6) << rec.timestamp << "  "
              << std::hex << "0x" << rec.arbitrationId << std::dec
              << (rec.isExtendedId ? " ext" : " std") << (rec.isRemoteFrame ? " rtr" : "")
              << (rec.isErrorFrame ? " err" : "") << "  dlc=" << rec.dlc << "  [";
    for (size_t i = 0; i < rec.data.size(); ++i) {
        if (i)
            std::cout << ' ';
        std::cout << std::hex << std::setw(2) << std::setfill('0') << int(rec.data[i])
                  << std::dec << std::setfill(' ');
    }
    std::cout << "]\n";
}

// =============================================================================
// Dump an existing log
// =============================================================================

static int dump(const std::string& path) {
    std::error_code ec;
    CsvReader reader(path, ec);
    CHECK_EC(ec, "open " << path);

    size_t count = 0;
    MessageRecord rec;
    while (true) {
        if (reader.next(rec, ec)) {
            printRecord(rec);
            ++count;
            continue;
        }
        if (!ec)
            break;
        if (!isMalformedRecord(ec)) {
            std::cerr << "[FAIL] read: " << ec.message() << "\n";
            return 1;
        }
        // report and keep going
        std::cerr << "line " << reader.lineNumber() << ": " << ec.message() << ": "
                  << reader.lastLine() << "\n";
    }
    std::cout << count << " records\n";
    return 0;
}

// =============================================================================
// Write, append and read back
// =============================================================================

static int demo(const std::string& path) {
    std::error_code ec;

    SECTION("Write (truncate + header)");
    {
        CsvWriter writer(path, false, ec);
        CHECK_EC(ec, "open for write");

        std::vector<MessageRecord> msgs;
        msgs.emplace_back(1483389946.197, 0xdadada, std::vector<uint8_t>{91, 52, 50, 44, 32, 57}, true);
        msgs.emplace_back(1483389946.2, 0x123, std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
        MessageRecord rtr(1483389946.25, 0x7ff, {});
        rtr.isRemoteFrame = true;
        rtr.dlc = 8;
        msgs.push_back(rtr);

        for (const auto& m : msgs) {
            writer.onMessageReceived(m, ec);
            CHECK_EC(ec, "write");
        }
        std::cout << "wrote " << msgs.size() << " records to " << path << "\n";
    }

    SECTION("Append (no header)");
    {
        CsvWriter writer(path, true, ec);
        CHECK_EC(ec, "open for append");

        MessageRecord err(1483389947.0, 0x0, {});
        err.isErrorFrame = true;
        writer.onMessageReceived(err, ec);
        CHECK_EC(ec, "append");
        writer.sync(ec);
        CHECK_EC(ec, "sync");
        std::cout << "appended 1 record\n";
    }

    SECTION("Read back");
    return dump(path);
}

int main(int argc, char** argv) {
    if (argc == 3 && std::string(argv[1]) == "dump")
        return dump(argv[2]);
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [path] | dump <path>\n";
        return 2;
    }
    return demo(argc == 2 ? argv[1] : "./test/demo.csv");
}
