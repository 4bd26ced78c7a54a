#pragma once
#include <optional>
#include <string>

#include "common/types.hpp"

namespace formation {

// 支持：YYYY-MM-DD[T| ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]
// 无时区后缀时按 UTC 处理。格式不对返回 nullopt。
std::optional<EpochSeconds> ParseIsoTimestamp(const std::string& text);

// 输出 YYYY-MM-DDTHH:MM:SSZ
std::string FormatIsoTimestamp(EpochSeconds t);

// UTC 午夜起算的整分钟数（秒被丢弃）
int MinutesOfDay(EpochSeconds t);

// 一天内分钟差，跨午夜回绕：min(|a-b|, 1440-|a-b|)
int CircularMinuteGap(int minutes_a, int minutes_b);

} // namespace formation
