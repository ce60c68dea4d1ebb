#pragma once

#include <iosfwd>
#include <memory>

#include "flakelib/flake/clock.hpp"

namespace flakelib::cli {

/**
 * @brief コマンドの終了コード
 */
enum ExitCode : int {
    kExitOk = 0,
    kExitGenerationFailed = 1,  ///< 時計の逆行・シーケンス枯渇
    kExitUsage = 2              ///< 引数・設定の不正
};

/**
 * @brief flake_gen 本体
 *
 * 設定の優先順位: 既定値 < --config ファイル < FLAKELIB_* 環境変数 < コマンドライン。
 * IDは out に1行ずつ、エラーメッセージは err に出す。
 * @param clock 時刻取得元（nullptr で SystemClock）
 * @return ExitCode
 */
int run_flake_gen(int argc, char* argv[], std::ostream& out, std::ostream& err,
                  std::shared_ptr<flake::Clock> clock = nullptr);

/**
 * @brief flake_decode 本体
 *
 * 引数の各IDを分解して表示する。解析できないIDがあれば残りも処理したうえで kExitUsage。
 */
int run_flake_decode(int argc, char* argv[], std::ostream& out, std::ostream& err);

} // namespace flakelib::cli
