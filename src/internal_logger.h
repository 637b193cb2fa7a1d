/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMOGG_INTERNAL_LOGGER_H
#define LMSHAO_LMOGG_INTERNAL_LOGGER_H

#include <mutex>

#include "lmogg/lmogg_logger.h"

namespace lmshao::lmogg {

inline lmshao::lmcore::Logger &GetLmoggLoggerWithAutoInit()
{
    static std::once_flag initFlag;
    std::call_once(initFlag, []() { InitLmoggLogger(); });
    return lmshao::lmcore::LoggerRegistry::GetLogger<LmoggModuleTag>();
}

#define LMOGG_LOG_IMPL(level, fmt, ...)                                                                                \
    do {                                                                                                               \
        auto &logger = lmshao::lmogg::GetLmoggLoggerWithAutoInit();                                                    \
        if (logger.ShouldLog(level)) {                                                                                 \
            logger.LogWithModuleTag<lmshao::lmogg::LmoggModuleTag>(level, __FILE__, __LINE__, __FUNCTION__, fmt,       \
                                                                   ##__VA_ARGS__);                                     \
        }                                                                                                              \
    } while (0)

#define LMOGG_LOGD(fmt, ...) LMOGG_LOG_IMPL(lmshao::lmcore::LogLevel::kDebug, fmt, ##__VA_ARGS__)
#define LMOGG_LOGI(fmt, ...) LMOGG_LOG_IMPL(lmshao::lmcore::LogLevel::kInfo, fmt, ##__VA_ARGS__)
#define LMOGG_LOGW(fmt, ...) LMOGG_LOG_IMPL(lmshao::lmcore::LogLevel::kWarn, fmt, ##__VA_ARGS__)
#define LMOGG_LOGE(fmt, ...) LMOGG_LOG_IMPL(lmshao::lmcore::LogLevel::kError, fmt, ##__VA_ARGS__)
#define LMOGG_LOGF(fmt, ...) LMOGG_LOG_IMPL(lmshao::lmcore::LogLevel::kFatal, fmt, ##__VA_ARGS__)

} // namespace lmshao::lmogg

#endif // LMSHAO_LMOGG_INTERNAL_LOGGER_H
