#pragma once

#include <QString>

#include <stdexcept>

namespace taskbook {
namespace core {

class TaskbookError : public std::runtime_error
{
public:
    explicit TaskbookError(const QString &message);

    QString message() const;
};

// Bad user input: title, date, priority, status or sort key.
class ValidationError : public TaskbookError
{
public:
    using TaskbookError::TaskbookError;
};

class NotFoundError : public TaskbookError
{
public:
    using TaskbookError::TaskbookError;
};

class ParseError : public TaskbookError
{
public:
    using TaskbookError::TaskbookError;
};

// The file parsed as JSON but does not have the task file layout.
class SchemaError : public TaskbookError
{
public:
    using TaskbookError::TaskbookError;
};

class IoError : public TaskbookError
{
public:
    using TaskbookError::TaskbookError;
};

} // namespace core
} // namespace taskbook
