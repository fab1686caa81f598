#include "taskbook/core/Errors.hpp"

namespace taskbook {
namespace core {

TaskbookError::TaskbookError(const QString &message)
    : std::runtime_error(message.toStdString())
{
}

QString TaskbookError::message() const
{
    return QString::fromUtf8(what());
}

} // namespace core
} // namespace taskbook
