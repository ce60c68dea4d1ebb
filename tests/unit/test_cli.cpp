#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "flakelib/cli/commands.hpp"
#include "flakelib/flake/flake_id.hpp"
#include "flakelib/utils/log_config.hpp"

using namespace flakelib;
using namespace flakelib::flake;

namespace {

// main に渡す形の引数を組み立てる
class Args {
public:
    explicit Args(std::vector<std::string> args) : storage_(std::move(args)) {
        for (auto& s : storage_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

// 構築時の1回目だけ進んだ時刻を返し、以後は1ms戻る
class BackwardsClock : public Clock {
public:
    uint64_t now_ms() override { return calls_++ == 0 ? 1000 : 999; }

private:
    int calls_ = 0;
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

WorkerId worker_of(const std::string& line) {
    auto id = parse_id(line);
    EXPECT_TRUE(id.has_value()) << line;
    return id ? unpack_id(id.value()).worker_id : WorkerId{};
}

} // namespace

class FlakeGenTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_env();
        test_dir = std::filesystem::temp_directory_path() / "flakelib_cli_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        clear_env();
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
        utils::LogManager::instance().clear_global_sinks();
        utils::LogManager::instance().set_global_level(utils::LogLevel::Info);
    }

    static void clear_env() {
        for (const char* name : {"FLAKELIB_WORKER_ID", "FLAKELIB_ENDIANNESS", "FLAKELIB_SEQUENCE_POLICY",
                                 "FLAKELIB_LOG_LEVEL", "FLAKELIB_LOG_FILE"}) {
            unsetenv(name);
        }
    }

    int gen(std::vector<std::string> args, std::shared_ptr<Clock> clock = nullptr) {
        args.insert(args.begin(), "flake_gen");
        Args a(std::move(args));
        out.str("");
        err.str("");
        if (!clock) clock = std::make_shared<ManualClock>(5000);
        return cli::run_flake_gen(a.argc(), a.argv(), out, err, std::move(clock));
    }

    std::filesystem::path write_config(const std::string& content) {
        auto path = test_dir / "flake.ini";
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::ostringstream out;
    std::ostringstream err;
    std::filesystem::path test_dir;
};

TEST_F(FlakeGenTest, HelpExitsZero) {
    EXPECT_EQ(gen({"--help"}), cli::kExitOk);
    EXPECT_NE(out.str().find("Usage: flake_gen"), std::string::npos);
}

TEST_F(FlakeGenTest, GeneratesRequestedCount) {
    ASSERT_EQ(gen({"--worker-id=00:01:02:03:04:05", "--count=3"}), cli::kExitOk);
    auto lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 3u);

    FlakeId prev = 0;
    for (const auto& line : lines) {
        auto id = parse_id(line);
        ASSERT_TRUE(id.has_value()) << line;
        FlakeFields f = unpack_id(id.value());
        EXPECT_EQ(f.timestamp_ms, 5000u);
        EXPECT_EQ(f.worker_id, (WorkerId{0, 1, 2, 3, 4, 5}));
        EXPECT_GT(id.value(), prev);
        prev = id.value();
    }
    EXPECT_TRUE(err.str().empty());
}

TEST_F(FlakeGenTest, ZeroCountPrintsNothing) {
    EXPECT_EQ(gen({"--worker-id=000102030405", "--count=0"}), cli::kExitOk);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(FlakeGenTest, OutputFormats) {
    ASSERT_EQ(gen({"--worker-id=000102030405", "--format=hex"}), cli::kExitOk);
    auto hex = split_lines(out.str());
    ASSERT_EQ(hex.size(), 1u);
    EXPECT_EQ(hex[0].size(), 34u);
    EXPECT_EQ(hex[0].rfind("0x", 0), 0u);
    EXPECT_EQ(worker_of(hex[0]), (WorkerId{0, 1, 2, 3, 4, 5}));

    ASSERT_EQ(gen({"--worker-id=000102030405", "--format=bytes"}), cli::kExitOk);
    auto bytes = split_lines(out.str());
    ASSERT_EQ(bytes.size(), 1u);
    // 16バイトを空白区切り、バイト0（シーケンス下位）から
    EXPECT_EQ(bytes[0].size(), 47u);
    EXPECT_EQ(bytes[0].substr(6, 17), "00 01 02 03 04 05");
}

TEST_F(FlakeGenTest, BadArgumentsExitTwo) {
    EXPECT_EQ(gen({}), cli::kExitUsage);  // worker_id なし
    EXPECT_NE(err.str().find("invalid configuration"), std::string::npos);

    EXPECT_EQ(gen({"--worker-id=zz:01:02:03:04:05"}), cli::kExitUsage);
    EXPECT_EQ(gen({"--worker-id=000102030405", "--endianness=middle"}), cli::kExitUsage);
    EXPECT_EQ(gen({"--worker-id=000102030405", "--sequence-policy=block"}), cli::kExitUsage);
    EXPECT_EQ(gen({"--worker-id=000102030405", "--format=octal"}), cli::kExitUsage);
    EXPECT_EQ(gen({"--worker-id=000102030405", "--count=-1"}), cli::kExitUsage);
    EXPECT_EQ(gen({"--worker-id=000102030405", "--count=abc"}), cli::kExitUsage);
    EXPECT_EQ(gen({"--worker-id=000102030405", "extra"}), cli::kExitUsage);
    EXPECT_NE(err.str().find("unexpected argument: extra"), std::string::npos);

    EXPECT_EQ(gen({"--config=" + (test_dir / "missing.ini").string()}), cli::kExitUsage);
    EXPECT_NE(err.str().find("cannot open"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(FlakeGenTest, ClockRegressionExitsOne) {
    EXPECT_EQ(gen({"--worker-id=000102030405", "--count=2"}, std::make_shared<BackwardsClock>()),
              cli::kExitGenerationFailed);
    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("clock is running backwards"), std::string::npos);
}

// 既定値 < 設定ファイル < 環境変数 < コマンドライン
TEST_F(FlakeGenTest, SettingPrecedence) {
    auto path = write_config("count = 2\n[flaker]\nworker_id = 01:01:01:01:01:01\n");
    const std::string config_arg = "--config=" + path.string();

    ASSERT_EQ(gen({config_arg}), cli::kExitOk);
    auto lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(worker_of(lines[0]), (WorkerId{1, 1, 1, 1, 1, 1}));

    setenv("FLAKELIB_WORKER_ID", "02:02:02:02:02:02", 1);
    ASSERT_EQ(gen({config_arg}), cli::kExitOk);
    lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(worker_of(lines[0]), (WorkerId{2, 2, 2, 2, 2, 2}));

    ASSERT_EQ(gen({config_arg, "--worker-id=03:03:03:03:03:03", "--count=4"}), cli::kExitOk);
    lines = split_lines(out.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(worker_of(lines[0]), (WorkerId{3, 3, 3, 3, 3, 3}));
}

class FlakeDecodeTest : public ::testing::Test {
protected:
    int decode(std::vector<std::string> args) {
        args.insert(args.begin(), "flake_decode");
        Args a(std::move(args));
        out.str("");
        err.str("");
        return cli::run_flake_decode(a.argc(), a.argv(), out, err);
    }

    FlakeId sample() const {
        FlakeFields f;
        f.timestamp_ms = 1000000;
        f.worker_id = {0, 1, 2, 3, 4, 5};
        f.sequence = 7;
        return pack_id(f);
    }

    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(FlakeDecodeTest, DecodesDecimalAndHex) {
    EXPECT_EQ(decode({to_decimal_string(sample()), "0x" + to_hex_string(sample())}), cli::kExitOk);
    const std::string text = out.str();
    EXPECT_NE(text.find("timestamp: 1000000 (1970-01-01T00:16:40.000Z)"), std::string::npos);
    EXPECT_NE(text.find("worker_id: 00:01:02:03:04:05"), std::string::npos);
    EXPECT_NE(text.find("sequence:  7"), std::string::npos);
    EXPECT_EQ(split_lines(text).size(), 10u);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(FlakeDecodeTest, UnparsableIdExitsTwo) {
    EXPECT_EQ(decode({"not-an-id", to_decimal_string(sample())}), cli::kExitUsage);
    EXPECT_NE(err.str().find("not-an-id"), std::string::npos);
    // 後続の正しいIDは表示される
    EXPECT_NE(out.str().find("sequence:  7"), std::string::npos);
}

TEST_F(FlakeDecodeTest, UsageHandling) {
    EXPECT_EQ(decode({}), cli::kExitUsage);
    EXPECT_EQ(decode({"--help"}), cli::kExitOk);
    EXPECT_NE(out.str().find("Usage: flake_decode"), std::string::npos);
}
