// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QString>

#include <expected>
#include <utility>

namespace Ribbon {

enum class RibbonErrorCode : quint8 {
    None = 0,
    InvalidSpan,
    Configuration,
    NotFound,
    InvalidArgument,
    Duplicate
};

class RIBBON_EXPORT RibbonError final {
public:
    RibbonError() = default;
    RibbonError(RibbonErrorCode code, QString message)
        : m_code(code), m_message(std::move(message)) {}

    bool ok() const noexcept { return m_code == RibbonErrorCode::None; }
    RibbonErrorCode code() const noexcept { return m_code; }
    const QString& message() const noexcept { return m_message; }

    static RibbonError none() { return {}; }

private:
    RibbonErrorCode m_code{RibbonErrorCode::None};
    QString m_message;
};

/// Result type for operations that produce a value or fail.
template<typename T>
using RibbonExpected = std::expected<T, RibbonError>;

inline std::unexpected<RibbonError> ribbonFailure(RibbonErrorCode code, QString message)
{
    return std::unexpected<RibbonError>(RibbonError(code, std::move(message)));
}

struct RIBBON_EXPORT RibbonResult final
{
    RibbonError error;

    static RibbonResult success() { return {}; }
    static RibbonResult failure(RibbonErrorCode code, QString msg)
    {
        RibbonResult r;
        r.error = RibbonError(code, std::move(msg));
        return r;
    }
    static RibbonResult failure(RibbonError err)
    {
        RibbonResult r;
        r.error = std::move(err);
        return r;
    }

    bool ok() const noexcept { return error.ok(); }
    RibbonErrorCode code() const noexcept { return error.code(); }
    explicit operator bool() const { return ok(); }
};

} // namespace Ribbon
