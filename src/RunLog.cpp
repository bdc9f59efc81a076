#include "RunLog.h"

#include <QDir>
#include <QFile>
#include <QTextStream>

#include <cstdio>
#include <mutex>

static std::mutex s_logMutex;
static QFile *s_logFile = nullptr;
static QString s_logFilePath;

static void runLogHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const QString line = RunLog::formatMessage(type, context, msg);
    const QByteArray bytes = line.toLocal8Bit();

    std::lock_guard<std::mutex> lk(s_logMutex);
    std::fprintf(stderr, "%s\n", bytes.constData());
    std::fflush(stderr);

    if (s_logFile) {
        s_logFile->write(line.toUtf8());
        s_logFile->write("\n");
        s_logFile->flush();
    }
}

QString RunLog::fileName(const QString &tool, const QString &kind, const QDateTime &time)
{
    return QString("%1_%2_%3.txt").arg(tool, kind, time.toString("yyyyMMdd_HHmmss"));
}

QString RunLog::formatMessage(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const char *level = "INFO";
    switch (type) {
    case QtDebugMsg: level = "DEBUG"; break;
    case QtInfoMsg: level = "INFO"; break;
    case QtWarningMsg: level = "WARN"; break;
    case QtCriticalMsg: level = "ERROR"; break;
    case QtFatalMsg: level = "FATAL"; break;
    }

    QString line = QString("%1 %2 ").arg(QDateTime::currentDateTime().toString("HH:mm:ss.zzz"),
                                         QString::fromLatin1(level));
    if (context.category && qstrcmp(context.category, "default") != 0)
        line += QString("[%1] ").arg(QString::fromLatin1(context.category));
    return line + msg;
}

bool RunLog::install(const QString &directory, const QString &tool, QString *errorString)
{
    if (directory.isEmpty()) {
        qInstallMessageHandler(runLogHandler);
        return true;
    }

    QDir dir(directory);
    if (!dir.mkpath(".")) {
        *errorString = QString("Failed to create log directory %1").arg(dir.absolutePath());
        qInstallMessageHandler(runLogHandler);
        return false;
    }

    const QString path = dir.filePath(fileName(tool, "log", QDateTime::currentDateTime()));
    QFile *file = new QFile(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Append)) {
        *errorString = QString("Failed to open log file %1: %2").arg(path, file->errorString());
        delete file;
        qInstallMessageHandler(runLogHandler);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(s_logMutex);
        s_logFile = file;
        s_logFilePath = path;
    }
    qInstallMessageHandler(runLogHandler);
    return true;
}

void RunLog::uninstall()
{
    qInstallMessageHandler(nullptr);

    std::lock_guard<std::mutex> lk(s_logMutex);
    if (s_logFile) {
        s_logFile->close();
        delete s_logFile;
        s_logFile = nullptr;
    }
}

QString RunLog::logFilePath()
{
    std::lock_guard<std::mutex> lk(s_logMutex);
    return s_logFilePath;
}

bool RunLog::writeSummary(const QString &directory, const QString &tool, const QStringList &lines,
                          QString *path, QString *errorString)
{
    QDir dir(directory.isEmpty() ? QString(".") : directory);
    if (!dir.mkpath(".")) {
        *errorString = QString("Failed to create log directory %1").arg(dir.absolutePath());
        return false;
    }

    *path = dir.filePath(fileName(tool, "summary", QDateTime::currentDateTime()));
    QFile file(*path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        *errorString = QString("Failed to write %1: %2").arg(*path, file.errorString());
        return false;
    }

    QTextStream out(&file);
    for (const QString &line : lines)
        out << line << "\n";
    out.flush();
    if (out.status() != QTextStream::Ok) {
        *errorString = QString("Failed to write %1").arg(*path);
        return false;
    }
    return true;
}
