#include <gtest/gtest.h>
#include "ecs_logger/formatters/ecs_formatter.hpp"
#include "ecs_logger/log_level.hpp"
#include "ecs_logger/log_record.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using ecs_logger::EcsFormatter;
using ecs_logger::ExtraFieldsStore;
using ecs_logger::LogLevel;
using ecs_logger::LogRecord;
using ecs_logger::Status;

static LogRecord make_test_record() {
    LogRecord record{};
    record.wall_clock_ns = 1680254706576136800ULL;
    record.level = LogLevel::Error;
    record.message = "error log! 123!";
    record.target = "net::http";
    record.module_path = "net::http";
    record.file_path = "src/net/http_client.cpp";
    record.line = 67;
    return record;
}

static std::string format_with(const EcsFormatter& fmt, const LogRecord& record) {
    std::string out;
    size_t n = fmt.Format(record, out);
    EXPECT_EQ(n, out.size());
    return out;
}

static std::string format_plain(const LogRecord& record) {
    return format_with(EcsFormatter{}, record);
}

TEST(EcsFormatter, ExactLayout) {
    auto out = format_plain(make_test_record());
    EXPECT_EQ(out,
              R"({"@timestamp":"2023-03-31T09:25:06.576136800Z","log.level":"ERROR",)"
              R"("message":"error log! 123!","ecs.version":"1.12.1",)"
              R"("log.origin":{"file":{"line":67,"name":"http_client.cpp"},)"
              R"("cpp":{"target":"net::http","module_path":"net::http","file_path":"src/net/http_client.cpp"}}})");
}

TEST(EcsFormatter, SingleLineNoWhitespace) {
    auto out = format_plain(make_test_record());
    EXPECT_EQ(out.find('\n'), std::string::npos);
    EXPECT_EQ(out.front(), '{');
    EXPECT_EQ(out.back(), '}');
}

TEST(EcsFormatter, AppendsToExistingBuffer) {
    EcsFormatter fmt;
    std::string out = "prefix";
    size_t n = fmt.Format(make_test_record(), out);
    EXPECT_EQ(out.size(), n + 6);
    EXPECT_EQ(out.compare(0, 7, "prefix{"), 0);
}

TEST(EcsFormatter, DefaultScenarioHasOnlyFixedFields) {
    LogRecord record{};
    record.wall_clock_ns = 1680254706576136800ULL;
    record.level = LogLevel::Error;
    record.message = "this is printed by default";
    record.target = "example::tests";
    record.file_path = "example.rs";
    record.line = 13;

    auto store = std::make_shared<ExtraFieldsStore>();
    auto parsed = nlohmann::json::parse(format_with(EcsFormatter(store), record));

    EXPECT_EQ(parsed["log.level"], "ERROR");
    EXPECT_EQ(parsed["message"], "this is printed by default");
    EXPECT_EQ(parsed["log.origin"]["file"]["line"], 13);
    EXPECT_EQ(parsed["log.origin"]["file"]["name"], "example.rs");
    EXPECT_EQ(parsed["log.origin"]["cpp"]["target"], "example::tests");
    EXPECT_EQ(parsed.size(), 5u);
}

TEST(EcsFormatter, LocationFieldsAreOptional) {
    LogRecord record{};
    record.wall_clock_ns = 1680254706576136800ULL;
    record.level = LogLevel::Info;
    record.message = "no location";
    record.target = "app";

    auto out = format_plain(record);
    EXPECT_NE(out.find(R"("log.origin":{"file":{},"cpp":{"target":"app"}})"), std::string::npos);

    auto parsed = nlohmann::json::parse(out);
    EXPECT_TRUE(parsed["log.origin"]["file"].empty());
    EXPECT_FALSE(parsed["log.origin"]["cpp"].contains("module_path"));
    EXPECT_FALSE(parsed["log.origin"]["cpp"].contains("file_path"));
}

TEST(EcsFormatter, LineWithoutFile) {
    LogRecord record = make_test_record();
    record.file_path.reset();
    record.module_path.reset();

    auto out = format_plain(record);
    EXPECT_NE(out.find(R"("file":{"line":67})"), std::string::npos);
    EXPECT_NE(out.find(R"("cpp":{"target":"net::http"}})"), std::string::npos);
}

TEST(EcsFormatter, FileWithoutLine) {
    LogRecord record = make_test_record();
    record.line.reset();

    auto out = format_plain(record);
    EXPECT_NE(out.find(R"("file":{"name":"http_client.cpp"})"), std::string::npos);
}

TEST(EcsFormatter, FileNameTakesLastSegment) {
    LogRecord record = make_test_record();
    record.file_path = "C:\\work\\src\\main.cpp";
    auto parsed = nlohmann::json::parse(format_plain(record));
    EXPECT_EQ(parsed["log.origin"]["file"]["name"], "main.cpp");
    EXPECT_EQ(parsed["log.origin"]["cpp"]["file_path"], "C:\\work\\src\\main.cpp");

    record.file_path = "main.cpp";
    parsed = nlohmann::json::parse(format_plain(record));
    EXPECT_EQ(parsed["log.origin"]["file"]["name"], "main.cpp");
}

TEST(EcsFormatter, AllLevels) {
    auto record = make_test_record();
    auto level_pairs = std::array<std::pair<LogLevel, const char*>, 5>{
        std::pair<LogLevel, const char*>{LogLevel::Trace, "TRACE"},
        std::pair<LogLevel, const char*>{LogLevel::Debug, "DEBUG"},
        std::pair<LogLevel, const char*>{LogLevel::Info, "INFO"},
        std::pair<LogLevel, const char*>{LogLevel::Warn, "WARN"},
        std::pair<LogLevel, const char*>{LogLevel::Error, "ERROR"}
    };
    for (const auto& item : level_pairs) {
        record.level = item.first;
        auto out = format_plain(record);
        std::string needle = std::string("\"log.level\":\"") + item.second + "\"";
        EXPECT_NE(out.find(needle), std::string::npos);
    }
}

TEST(EcsFormatter, EscapeQuoteAndBackslash) {
    auto record = make_test_record();
    record.message = R"(log with "custom target" in C:\tmp)";
    auto out = format_plain(record);
    EXPECT_NE(out.find(R"("message":"log with \"custom target\" in C:\\tmp")"), std::string::npos);
}

TEST(EcsFormatter, EscapeControlCharacters) {
    auto record = make_test_record();
    std::string msg = std::string("a\nb\rc\td\be\ff") + '\x01' + "g" + '\x1f';
    record.message = msg;
    auto out = format_plain(record);
    EXPECT_NE(out.find(R"("message":"a\nb\rc\td\be\ff\u0001g\u001f")"), std::string::npos);
    EXPECT_EQ(out.find('\n'), std::string::npos);

    auto parsed = nlohmann::json::parse(out);
    EXPECT_EQ(parsed["message"], msg);
}

TEST(EcsFormatter, NonAsciiPassesThrough) {
    auto record = make_test_record();
    record.message = "caf\xc3\xa9 \xe6\x97\xa5\xe5\xbf\x97";
    auto out = format_plain(record);
    EXPECT_NE(out.find("\"message\":\"caf\xc3\xa9 \xe6\x97\xa5\xe5\xbf\x97\""), std::string::npos);
    EXPECT_EQ(out.find("\\u"), std::string::npos);
}

TEST(EcsFormatter, InvalidUtf8IsReplaced) {
    auto record = make_test_record();
    record.message = "bad \xff\xfe byte";
    auto out = format_plain(record);

    auto parsed = nlohmann::json::parse(out);
    EXPECT_EQ(parsed["message"], "bad \xEF\xBF\xBD\xEF\xBF\xBD byte");
}

TEST(EcsFormatter, InvalidUtf8Sequences) {
    const std::string fffd = "\xEF\xBF\xBD";
    const std::pair<std::string, std::string> cases[] = {
        // truncated 3-byte sequence: one replacement for the maximal subpart
        {std::string("a\xe6\x97") + "z", "a" + fffd + "z"},
        // stray continuation byte
        {std::string("\x80") + "z", fffd + "z"},
        // overlong encoding of '/'
        {std::string("\xc0\xaf"), fffd + fffd},
        // UTF-16 surrogate half
        {std::string("\xed\xa0\x80"), fffd + fffd + fffd},
        // beyond U+10FFFF
        {std::string("\xf4\x90\x80\x80"), fffd + fffd + fffd + fffd},
        // truncated at end of input
        {std::string("end\xf0\x9f"), "end" + fffd},
    };
    for (const auto& item : cases) {
        std::string out;
        EcsFormatter::AppendEscaped(item.first, out);
        EXPECT_EQ(out, item.second);
    }
}

TEST(EcsFormatter, InvalidUtf8InTargetAndPath) {
    auto record = make_test_record();
    record.target = "net\xff";
    record.file_path = "src/\xfe.cpp";
    auto parsed = nlohmann::json::parse(format_plain(record));
    EXPECT_EQ(parsed["log.origin"]["cpp"]["target"], "net\xEF\xBF\xBD");
    EXPECT_EQ(parsed["log.origin"]["file"]["name"], "\xEF\xBF\xBD.cpp");
}

TEST(EcsFormatter, EmptyMessage) {
    auto record = make_test_record();
    record.message = "";
    auto out = format_plain(record);
    EXPECT_NE(out.find(R"("message":"")"), std::string::npos);
}

TEST(EcsFormatter, ExtraFieldsAreMergedAtTopLevel) {
    auto store = std::make_shared<ExtraFieldsStore>();
    EcsFormatter fmt(store);
    auto record = make_test_record();
    record.level = LogLevel::Info;

    ASSERT_EQ(store->Set(nlohmann::ordered_json{{"my_field", "my_value"}}), Status::Ok);
    auto out = format_with(fmt, record);
    EXPECT_NE(out.find(R"(.cpp"}},"my_field":"my_value"})"), std::string::npos);
    auto parsed = nlohmann::json::parse(out);
    EXPECT_EQ(parsed["my_field"], "my_value");
    EXPECT_EQ(parsed.size(), 6u);

    store->Clear();
    parsed = nlohmann::json::parse(format_with(fmt, record));
    EXPECT_FALSE(parsed.contains("my_field"));
    EXPECT_EQ(parsed.size(), 5u);
}

TEST(EcsFormatter, NestedExtraFields) {
    auto store = std::make_shared<ExtraFieldsStore>();
    nlohmann::ordered_json payload;
    payload["service"] = {{"name", "billing"}, {"version", "2.1.0"}};
    payload["labels"] = {{"env", "prod"}};
    ASSERT_EQ(store->Set(payload), Status::Ok);

    auto parsed = nlohmann::json::parse(format_with(EcsFormatter(store), make_test_record()));
    EXPECT_EQ(parsed["service"]["name"], "billing");
    EXPECT_EQ(parsed["labels"]["env"], "prod");
}

TEST(EcsFormatter, ReservedFieldsWinOverExtraFields) {
    auto store = std::make_shared<ExtraFieldsStore>();
    nlohmann::ordered_json payload;
    payload["message"] = "from extra fields";
    payload["log.level"] = "FATAL";
    payload["ecs.version"] = "9.9.9";
    payload["@timestamp"] = "yesterday";
    payload["log.origin"] = {{"file", {{"line", 1}}}};
    payload["trace.id"] = "4bf92f3577b34da6";
    ASSERT_EQ(store->Set(payload), Status::Ok);

    auto out = format_with(EcsFormatter(store), make_test_record());
    auto parsed = nlohmann::json::parse(out);
    EXPECT_EQ(parsed["message"], "error log! 123!");
    EXPECT_EQ(parsed["log.level"], "ERROR");
    EXPECT_EQ(parsed["ecs.version"], "1.12.1");
    EXPECT_EQ(parsed["@timestamp"], "2023-03-31T09:25:06.576136800Z");
    EXPECT_EQ(parsed["log.origin"]["file"]["line"], 67);
    EXPECT_EQ(parsed["trace.id"], "4bf92f3577b34da6");
    EXPECT_EQ(parsed.size(), 6u);

    // 保证没有重复的顶层 key
    EXPECT_EQ(out.find("from extra fields"), std::string::npos);
    EXPECT_EQ(out.find("FATAL"), std::string::npos);
}

TEST(EcsFormatter, OnlyReservedExtraFieldsAddNothing) {
    auto store = std::make_shared<ExtraFieldsStore>();
    ASSERT_EQ(store->Set(nlohmann::ordered_json{{"message", "x"}}), Status::Ok);
    auto record = make_test_record();
    EXPECT_EQ(format_with(EcsFormatter(store), record), format_plain(record));
}

TEST(EcsFormatter, EmptyObjectAddsNothing) {
    auto store = std::make_shared<ExtraFieldsStore>();
    ASSERT_EQ(store->Set(nlohmann::ordered_json::object()), Status::Ok);
    auto record = make_test_record();
    EXPECT_EQ(format_with(EcsFormatter(store), record), format_plain(record));
}

TEST(EcsFormatter, ConcurrentFormatWithSetAndClear) {
    auto store = std::make_shared<ExtraFieldsStore>();
    const EcsFormatter fmt(store);
    std::atomic<bool> stop{false};
    std::atomic<int> malformed{0};

    std::vector<std::thread> writers;
    for (int w = 0; w < 3; ++w) {
        writers.emplace_back([&store, &stop, w]() {
            nlohmann::ordered_json payload;
            payload["writer"] = w;
            payload["payload"] = std::string(64, static_cast<char>('a' + w));
            while (!stop.load(std::memory_order_relaxed)) {
                EXPECT_EQ(store->Set(payload), Status::Ok);
                store->Clear();
            }
        });
    }

    std::vector<std::thread> formatters;
    for (int f = 0; f < 4; ++f) {
        formatters.emplace_back([&fmt, &malformed]() {
            auto record = make_test_record();
            std::string out;
            for (int i = 0; i < 5000; ++i) {
                out.clear();
                fmt.Format(record, out);
                auto parsed = nlohmann::json::parse(out, nullptr, false);
                if (parsed.is_discarded() || !parsed.is_object()) {
                    malformed.fetch_add(1);
                    continue;
                }
                if (parsed.contains("writer")) {
                    int w = parsed["writer"].get<int>();
                    if (parsed["payload"] != std::string(64, static_cast<char>('a' + w))) {
                        malformed.fetch_add(1);
                    }
                }
            }
        });
    }

    for (auto& t : formatters) {
        t.join();
    }
    stop.store(true);
    for (auto& t : writers) {
        t.join();
    }
    EXPECT_EQ(malformed.load(), 0);
}
