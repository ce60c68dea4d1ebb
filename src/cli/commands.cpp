#include "flakelib/cli/commands.hpp"

#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

#include "flakelib/flake/flake_id.hpp"
#include "flakelib/flake/flaker.hpp"
#include "flakelib/flake/flaker_config.hpp"
#include "flakelib/flake/worker_id.hpp"
#include "flakelib/utils/config_loader.hpp"
#include "flakelib/utils/log_config.hpp"

namespace flakelib::cli {

using namespace flakelib::flake;

namespace {

void gen_usage(std::ostream& os) {
    os << "Usage: flake_gen [--worker-id=aa:bb:cc:dd:ee:ff] [--endianness=little|big] [--count=N]\n"
          "                 [--format=decimal|hex|bytes] [--sequence-policy=wrap|reject]\n"
          "                 [--log-level=LEVEL] [--log-file=PATH] [--config=FILE]\n"
          "Settings are also read from FLAKELIB_WORKER_ID, FLAKELIB_ENDIANNESS, ...\n"
          "A config file may put them at top level or under [flaker].\n";
}

void decode_usage(std::ostream& os) {
    os << "Usage: flake_decode <id> [<id> ...]\n"
          "  <id> is decimal or 0x-prefixed hex\n";
}

void print_id(std::ostream& out, const FlakeId& id, const std::string& format) {
    if (format == "hex") {
        out << "0x" << to_hex_string(id) << '\n';
    } else if (format == "bytes") {
        static const char digits[] = "0123456789abcdef";
        FlakeBytes bytes = to_bytes_le(id);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i > 0) out << ' ';
            out << digits[bytes[i] >> 4] << digits[bytes[i] & 0x0F];
        }
        out << '\n';
    } else {
        out << to_decimal_string(id) << '\n';
    }
}

std::string format_utc(uint64_t timestamp_ms) {
    std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &secs);
#else
    gmtime_r(&secs, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << (timestamp_ms % 1000) << 'Z';
    return ss.str();
}

} // namespace

int run_flake_gen(int argc, char* argv[], std::ostream& out, std::ostream& err,
                  std::shared_ptr<Clock> clock) {
    utils::ConfigLoader cli;
    cli.load_from_command_line(argc, argv);
    if (cli.get_bool("help")) {
        gen_usage(out);
        return kExitOk;
    }
    if (!cli.positional_args().empty()) {
        err << "unexpected argument: " << cli.positional_args().front() << "\n";
        gen_usage(err);
        return kExitUsage;
    }

    utils::ConfigLoader config;
    config.load_defaults({{"count", int64_t{1}}, {"format", std::string("decimal")}});
    std::string config_file = cli.get_string("config");
    if (!config_file.empty() && !config.load_from_file(config_file)) {
        err << "failed to load config: " << config.last_error() << "\n";
        return kExitUsage;
    }
    config.load_from_environment(kEnvPrefix, flaker_config_keys());
    for (const auto& key : cli.get_all_keys()) {
        config.set(key, cli.get_string(key));
    }

    utils::log_utils::setup_basic_logging(
        utils::log_utils::parse_log_level(config.get_string("log_level", "warning")),
        true, config.get_string("log_file"));
    auto logger = utils::LogManager::instance().get_logger("flake_gen");

    auto flaker_config = load_flaker_config(config);
    if (!flaker_config) {
        err << "invalid configuration: " << flaker_config.error().message() << "\n";
        gen_usage(err);
        return kExitUsage;
    }

    std::string format = config.get_string("format");
    if (format != "decimal" && format != "hex" && format != "bytes") {
        err << "--format must be decimal, hex or bytes\n";
        return kExitUsage;
    }
    int64_t count = config.get_int("count", -1);
    if (count < 0) {
        err << "--count must be a non-negative integer\n";
        return kExitUsage;
    }

    auto flaker = make_flaker(flaker_config.value(), std::move(clock));
    if (!flaker) {
        err << "cannot create generator: " << flaker.error().message() << "\n";
        return kExitUsage;
    }

    FLAKELIB_LOG_INFO(logger, "generating " + std::to_string(count) + " ids for worker " +
                                  format_worker_id(flaker.value().identifier()));
    int rc = kExitOk;
    for (int64_t i = 0; i < count; ++i) {
        auto id = flaker.value().get_id();
        if (!id) {
            FLAKELIB_LOG_ERROR(logger, "generation failed after " + std::to_string(i) + " ids: " +
                                           id.error().message());
            err << "generation failed: " << id.error().message() << "\n";
            rc = kExitGenerationFailed;
            break;
        }
        print_id(out, id.value(), format);
    }
    utils::LogManager::instance().flush_all();
    return rc;
}

int run_flake_decode(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    if (argc < 2) {
        decode_usage(err);
        return kExitUsage;
    }
    int rc = kExitOk;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            decode_usage(out);
            return kExitOk;
        }
        auto id = parse_id(arg);
        if (!id) {
            err << arg << ": " << id.error().message() << "\n";
            rc = kExitUsage;
            continue;
        }
        FlakeFields f = unpack_id(id.value());
        out << "id:        " << to_decimal_string(id.value()) << "\n"
            << "hex:       0x" << to_hex_string(id.value()) << "\n"
            << "timestamp: " << f.timestamp_ms << " (" << format_utc(f.timestamp_ms) << ")\n"
            << "worker_id: " << format_worker_id(f.worker_id) << "\n"
            << "sequence:  " << f.sequence << "\n";
    }
    return rc;
}

} // namespace flakelib::cli
