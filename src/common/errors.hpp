#pragma once

#include <optional>
#include <utility>

#include <QString>

#include "common/enums.hpp"

namespace updwatch {

enum class ErrorCategory {
    Config,
    Environment,
    Validation,
    Transport,
    Persistence,
    General
};

enum class ErrorKind {
    ConfigMissingKey,
    ConfigInvalidValue,
    PrimaryLogMissing,
    SecondaryLogMissing,
    LogsDirectoryMissing,
    CheckpointDirectoryCreationFailed,
    EncodingReadError,
    UpdateValidationFailed,
    NotificationTransportError,
    CheckpointWriteError,
    Unexpected
};

ErrorCategory errorCategory(ErrorKind kind);
EventId eventIdFor(ErrorKind kind);
QString toErrorKindString(ErrorKind kind);
QString toErrorCategoryString(ErrorCategory category);

struct StepError {
    ErrorKind kind = ErrorKind::Unexpected;
    QString message;
};

// Ok(value) or Err(kind, message). Pipeline steps return this instead of throwing.
template <typename T>
class StepResult
{
public:
    static StepResult ok(T value)
    {
        StepResult result;
        result.m_value = std::move(value);
        return result;
    }

    static StepResult err(ErrorKind kind, const QString &message)
    {
        StepResult result;
        result.m_error = StepError{kind, message};
        return result;
    }

    static StepResult err(const StepError &error)
    {
        StepResult result;
        result.m_error = error;
        return result;
    }

    bool isOk() const { return !m_error.has_value(); }
    const T &value() const { return *m_value; }
    T &value() { return *m_value; }
    const StepError &error() const { return *m_error; }

private:
    std::optional<T> m_value;
    std::optional<StepError> m_error;
};

template <>
class StepResult<void>
{
public:
    static StepResult ok() { return StepResult(); }

    static StepResult err(ErrorKind kind, const QString &message)
    {
        StepResult result;
        result.m_error = StepError{kind, message};
        return result;
    }

    static StepResult err(const StepError &error)
    {
        StepResult result;
        result.m_error = error;
        return result;
    }

    bool isOk() const { return !m_error.has_value(); }
    const StepError &error() const { return *m_error; }

private:
    std::optional<StepError> m_error;
};

} // namespace updwatch
