#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace tasktracker {
namespace data {

struct TaskItem
{
    QUuid id = QUuid::createUuid();
    QString name;
    QDateTime due;
};

} // namespace data
} // namespace tasktracker
