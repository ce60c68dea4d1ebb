#pragma once

#include <memory>
#include <string>
#include <vector>

#include "flakelib/expected.hpp"
#include "flakelib/flake/flaker.hpp"
#include "flakelib/utils/config_loader.hpp"

namespace flakelib::flake {

/// 環境変数のプレフィックス（"worker_id" → "FLAKELIB_WORKER_ID"）
inline constexpr const char* kEnvPrefix = "FLAKELIB_";

/// 設定ファイルのセクション名。"[flaker]" 配下のキーも読む
inline constexpr const char* kConfigSection = "flaker";

/**
 * @brief ジェネレータ設定
 */
struct FlakerConfig {
    WorkerId worker_id{};
    Endianness endianness = Endianness::Little;
    SequencePolicy sequence_policy = SequencePolicy::Wrap;
};

/**
 * @brief ジェネレータ設定で使うキー一覧
 *
 * worker_id / endianness / sequence_policy / log_level / log_file
 */
const std::vector<std::string>& flaker_config_keys();

/**
 * @brief ConfigLoader から設定を読み取る
 *
 * 各キーは "worker_id" を "flaker.worker_id" より優先して探す。
 * @return worker_id 未設定・各値の形式不正時は invalid_config
 */
Result<FlakerConfig> load_flaker_config(const utils::ConfigLoader& loader);

/**
 * @brief 設定からジェネレータを生成
 */
Result<Flaker> make_flaker(const FlakerConfig& config, std::shared_ptr<Clock> clock = nullptr);

} // namespace flakelib::flake
