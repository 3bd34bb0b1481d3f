#include "tasktracker/data/FileTaskStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include "tasktracker/core/Logging.hpp"

namespace tasktracker {
namespace data {

namespace {
struct TaskRecord
{
    core::TaskKind kind = core::TaskKind::Todo;
    QString description;
    QString by;
    QString from;
    QString to;
    bool done = false;
};

core::Task toTask(const TaskRecord &record)
{
    core::Task task;
    switch (record.kind) {
    case core::TaskKind::Deadline:
        task = core::makeDeadline(record.description, record.by);
        break;
    case core::TaskKind::Event:
        task = core::makeEvent(record.description, record.from, record.to);
        break;
    case core::TaskKind::Todo:
    default:
        task = core::makeTodo(record.description);
        break;
    }
    core::setTaskDone(task, record.done);
    return task;
}
} // namespace

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileTaskStorage::filePath() const
{
    return m_filePath;
}

std::optional<std::vector<core::Task>> FileTaskStorage::load() const
{
    std::vector<core::Task> tasks;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcStorage) << "no task file at" << m_filePath << "- starting empty";
        return tasks;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot open" << m_filePath << ":" << file.errorString();
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inTodo = false;
    TaskRecord current;

    auto finalizeTodo = [&]() {
        if (current.description.isEmpty()) {
            qCWarning(lcStorage) << "skipping task without description in" << m_filePath;
        } else {
            tasks.push_back(toTask(current));
        }
        current = TaskRecord{};
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VTODO")) {
            inTodo = true;
            current = TaskRecord{};
            return;
        }
        if (line == QLatin1String("END:VTODO")) {
            if (inTodo) {
                finalizeTodo();
            }
            inTodo = false;
            return;
        }
        if (!inTodo) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString name = line.left(colonIndex).section(';', 0, 0).toUpper();
        const QString rawValue = line.mid(colonIndex + 1);
        const QString value = decodeText(rawValue);

        if (name == QLatin1String("SUMMARY")) {
            current.description = value;
        } else if (name == QLatin1String("STATUS")) {
            current.done = rawValue.compare(QLatin1String("COMPLETED"), Qt::CaseInsensitive) == 0;
        } else if (name == QLatin1String("X-TASKTRACKER-KIND")) {
            current.kind = kindFromString(rawValue);
        } else if (name == QLatin1String("X-TASKTRACKER-BY")) {
            current.by = value;
        } else if (name == QLatin1String("X-TASKTRACKER-FROM")) {
            current.from = value;
        } else if (name == QLatin1String("X-TASKTRACKER-TO")) {
            current.to = value;
        }
    };

    // Continuation lines start with a space or tab and extend the previous line.
    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    qCDebug(lcStorage) << "loaded" << tasks.size() << "tasks from" << m_filePath;
    return tasks;
}

bool FileTaskStorage::save(const std::vector<core::Task> &tasks)
{
    if (m_filePath.isEmpty()) {
        qCWarning(lcStorage) << "no task file configured";
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStorage) << "cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot write" << m_filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Task Tracker//EN\n";

    for (const auto &task : tasks) {
        stream << "BEGIN:VTODO\n";
        stream << "SUMMARY:" << encodeText(core::taskDescription(task)) << '\n';
        stream << "STATUS:" << (core::isTaskDone(task) ? "COMPLETED" : "NEEDS-ACTION") << '\n';
        stream << "X-TASKTRACKER-KIND:" << kindToString(core::taskKind(task)) << '\n';
        if (const auto *deadline = std::get_if<core::DeadlineTask>(&task)) {
            stream << "X-TASKTRACKER-BY:" << encodeText(deadline->by) << '\n';
        } else if (const auto *event = std::get_if<core::EventTask>(&task)) {
            stream << "X-TASKTRACKER-FROM:" << encodeText(event->from) << '\n';
            stream << "X-TASKTRACKER-TO:" << encodeText(event->to) << '\n';
        }
        stream << "END:VTODO\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcStorage) << "failed to commit" << m_filePath << ":" << file.errorString();
        return false;
    }
    qCDebug(lcStorage) << "saved" << tasks.size() << "tasks to" << m_filePath;
    return true;
}

QString FileTaskStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

// Single left-to-right pass so an escaped backslash never starts a new escape.
QString FileTaskStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded.append(ch);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded.append(QLatin1Char('\n'));
        } else {
            decoded.append(next);
        }
    }
    return decoded;
}

QString FileTaskStorage::kindToString(core::TaskKind kind)
{
    switch (kind) {
    case core::TaskKind::Deadline:
        return QStringLiteral("DEADLINE");
    case core::TaskKind::Event:
        return QStringLiteral("EVENT");
    case core::TaskKind::Todo:
    default:
        return QStringLiteral("TODO");
    }
}

core::TaskKind FileTaskStorage::kindFromString(const QString &value)
{
    const QString normalized = value.toUpper();
    if (normalized == QLatin1String("DEADLINE")) {
        return core::TaskKind::Deadline;
    }
    if (normalized == QLatin1String("EVENT")) {
        return core::TaskKind::Event;
    }
    return core::TaskKind::Todo;
}

} // namespace data
} // namespace tasktracker
