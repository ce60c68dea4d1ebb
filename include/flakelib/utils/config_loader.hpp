#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace flakelib::utils {

/**
 * @brief 設定値の型
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    bool
>;

/**
 * @brief 設定読み込み・管理クラス
 *
 * キーはドット区切り（"section.key"）。後から読み込んだ値が優先される。
 * テキスト由来の値は文字列のまま保持し、get_int などの取得時に変換する。
 * 想定する読み込み順: デフォルト → ファイル → 環境変数 → コマンドライン
 */
class ConfigLoader {
public:
    ConfigLoader();

    /**
     * @brief INI形式の設定ファイルを読み込み
     *
     * "key = value" 行、"[section]" 見出し、'#' / ';' コメントに対応。
     * @param file_path ファイルパス
     * @return 成功時true（ファイルが開けない、または不正行がある場合false）
     */
    bool load_from_file(const std::filesystem::path& file_path);

    /**
     * @brief INI形式の文字列から設定を読み込み
     */
    bool load_from_string(const std::string& content);

    /**
     * @brief 環境変数から設定を読み込み
     * @param prefix 環境変数のプレフィックス（例："FLAKELIB_"）
     * @param keys 対象キー（"worker_id" → "FLAKELIB_WORKER_ID"）
     * @return 読み込まれた設定数
     */
    size_t load_from_environment(const std::string& prefix, const std::vector<std::string>& keys);

    /**
     * @brief コマンドライン引数から設定を読み込み
     *
     * "--key=value" は値付き、"--flag" は true として扱う。'-' はキー内で '_' に正規化。
     * それ以外の引数は positional_args() に残す。
     * @return 読み込まれた設定数
     */
    size_t load_from_command_line(int argc, char* argv[]);

    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

    /**
     * @brief 設定値を設定
     */
    void set(const std::string& key, const ConfigValue& value);

    bool has(const std::string& key) const;

    /**
     * @brief 未登録のキーにだけデフォルト値を設定
     */
    void load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults);

    std::vector<std::string> get_all_keys() const;

    /**
     * @brief コマンドラインのオプション以外の引数
     */
    std::vector<std::string> positional_args() const;

    /**
     * @brief 最後の読み込みで発生したエラー
     */
    std::string last_error() const;

private:
    mutable std::mutex config_mutex_;
    std::unordered_map<std::string, ConfigValue> config_data_;
    std::vector<std::string> positional_;
    std::string last_error_;

    bool parse_lines(const std::string& content);
    const ConfigValue* find_value(const std::string& key) const;
    std::string to_string(const ConfigValue& value) const;
};

/**
 * @brief 設定ユーティリティ
 */
namespace config_utils {
    /**
     * @brief 環境変数名を正規化（"worker_id" → "FLAKELIB_WORKER_ID"）
     */
    std::string normalize_env_var_name(const std::string& key, const std::string& prefix = "");

    std::optional<std::string> get_env_var(const std::string& env_var_name);

    /**
     * @brief 真偽値文字列を解析
     * @return 解釈できない場合nullopt
     */
    std::optional<bool> parse_bool(const std::string& str);

    std::string trim(const std::string& str);
}

} // namespace flakelib::utils
