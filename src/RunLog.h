#ifndef RUNLOG_H
#define RUNLOG_H

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>

// Mirrors every Qt log message to the console and to a per-run text file.
class RunLog
{
public:
    // Creates <directory>/<tool>_log_YYYYMMDD_HHMMSS.txt and installs the
    // message handler. Console output keeps working if the file can't be opened.
    static bool install(const QString &directory, const QString &tool, QString *errorString);
    static void uninstall();
    static QString logFilePath();

    static QString fileName(const QString &tool, const QString &kind, const QDateTime &time);
    static QString formatMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg);

    static bool writeSummary(const QString &directory, const QString &tool, const QStringList &lines,
                             QString *path, QString *errorString);
};

#endif // RUNLOG_H
