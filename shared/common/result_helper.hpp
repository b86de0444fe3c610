// ============================================================================
// File: shared/common/result_helper.hpp
// Description: Result<T> helper macros
// Depends on: shared/common/result.h
// ============================================================================

#pragma once
#include "result.h"

#include <fmt/core.h>

// ----------------------------------------------------------------------------
// 1. RETURN_IF_ERR
// ----------------------------------------------------------------------------
// 사용 예시:
//   auto r = registry.add(cmd);
//   RETURN_IF_ERR(r);
// ----------------------------------------------------------------------------
#define RETURN_IF_ERR(res)                                     \
    do {                                                       \
        if (!(res)) {                                          \
            return Result<void>::Error((res).code(), (res).error()); \
        }                                                      \
    } while (0)

#define RETURN_IF_ERR_MSG(res, msg)                            \
    do {                                                       \
        if (!(res)) {                                          \
            auto err_str = (res).error().has_value()           \
                ? fmt::format("{}: {}", msg, *(res).error())   \
                : std::string(msg);                            \
            return Result<void>::Error((res).code(), err_str); \
        }                                                      \
    } while (0)

// ----------------------------------------------------------------------------
// 2. LOG_IF_ERR (member functions only, needs LOG_TAG)
// ----------------------------------------------------------------------------
#define LOG_IF_ERR(res)                                        \
    do {                                                       \
        if (!(res)) {                                          \
            if ((res).error().has_value())                     \
                LOGE("{}", *(res).error());                    \
            else                                               \
                LOGE("Error: {}", to_string((res).code()));    \
        }                                                      \
    } while (0)
