#pragma once

#include <QString>

#include "tasktracker/data/TaskStorage.hpp"

namespace tasktracker {
namespace data {

// Stores tasks as VTODO entries of an iCalendar file, in list order.
class FileTaskStorage : public TaskStorage
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() override = default;

    std::optional<std::vector<core::Task>> load() const override;
    bool save(const std::vector<core::Task> &tasks) override;

    const QString &filePath() const;

private:
    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString kindToString(core::TaskKind kind);
    static core::TaskKind kindFromString(const QString &value);

    QString m_filePath;
};

} // namespace data
} // namespace tasktracker
