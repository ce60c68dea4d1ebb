#include "flakelib/flake/flaker_config.hpp"

#include <optional>

#include "flakelib/error.hpp"
#include "flakelib/utils/log_config.hpp"

namespace flakelib::flake {

const std::vector<std::string>& flaker_config_keys() {
    static const std::vector<std::string> keys = {
        "worker_id", "endianness", "sequence_policy", "log_level", "log_file"
    };
    return keys;
}

// 素のキー（環境変数・コマンドライン由来）を [flaker] セクションより優先する
static std::optional<std::string> lookup(const utils::ConfigLoader& loader, const std::string& key) {
    if (loader.has(key)) return loader.get_string(key);
    std::string sectioned = std::string(kConfigSection) + "." + key;
    if (loader.has(sectioned)) return loader.get_string(sectioned);
    return std::nullopt;
}

Result<FlakerConfig> load_flaker_config(const utils::ConfigLoader& loader) {
    auto logger = utils::LogManager::instance().get_logger("flakelib.config");
    FlakerConfig config;

    auto worker_text = lookup(loader, "worker_id");
    if (!worker_text) {
        FLAKELIB_LOG_ERROR(logger, "worker_id is not configured");
        return make_error_code(FlakeErrc::invalid_config);
    }
    auto worker_id = parse_worker_id(*worker_text);
    if (!worker_id) {
        FLAKELIB_LOG_ERROR(logger, "invalid worker_id: " + *worker_text);
        return make_error_code(FlakeErrc::invalid_config);
    }
    config.worker_id = worker_id.value();

    if (auto text = lookup(loader, "endianness")) {
        auto endianness = parse_endianness(*text);
        if (!endianness) {
            FLAKELIB_LOG_ERROR(logger, "invalid endianness: " + *text);
            return make_error_code(FlakeErrc::invalid_config);
        }
        config.endianness = endianness.value();
    }

    if (auto text = lookup(loader, "sequence_policy")) {
        auto policy = parse_sequence_policy(*text);
        if (!policy) {
            FLAKELIB_LOG_ERROR(logger, "invalid sequence_policy: " + *text);
            return make_error_code(FlakeErrc::invalid_config);
        }
        config.sequence_policy = policy.value();
    }

    return config;
}

Result<Flaker> make_flaker(const FlakerConfig& config, std::shared_ptr<Clock> clock) {
    return Flaker::create(config.worker_id, config.endianness, std::move(clock), config.sequence_policy);
}

} // namespace flakelib::flake
