/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_LMOGG_LOGGER_H
#define LMSHAO_LMOGG_LMOGG_LOGGER_H

#include <string>

#include <lmcore/logger.h>

namespace lmshao::lmogg {

// Module tag for Lmogg
struct LmoggModuleTag {};

/**
 * @brief Initialize the LMOGG logger module.
 *
 * Optional: the library initializes itself with these defaults on first log.
 * Resync and stream errors are logged at kWarn, per-page tracing at kDebug.
 */
inline void InitLmoggLogger(lmcore::LogLevel level =
#if defined(_DEBUG) || defined(DEBUG) || !defined(NDEBUG)
                                lmcore::LogLevel::kDebug,
#else
                                lmcore::LogLevel::kWarn,
#endif
                            lmcore::LogOutput output = lmcore::LogOutput::CONSOLE, const std::string &filename = "")
{
    lmcore::LoggerRegistry::RegisterModule<LmoggModuleTag>("LMOGG");
    lmcore::LoggerRegistry::InitLogger<LmoggModuleTag>(level, output, filename);
}

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_LMOGG_LOGGER_H
