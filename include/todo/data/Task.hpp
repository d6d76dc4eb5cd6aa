#pragma once

#include <QDateTime>
#include <QString>
#include <vector>

namespace todo {
namespace data {

struct Task
{
    int id = 0;
    QString description;
    bool completed = false;
    QDateTime createdAt;
};

inline bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.id == rhs.id
        && lhs.description == rhs.description
        && lhs.completed == rhs.completed
        && lhs.createdAt == rhs.createdAt;
}

inline bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

// Insertion order is display order.
using TaskList = std::vector<Task>;

} // namespace data
} // namespace todo
