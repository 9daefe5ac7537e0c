#include "core/file_io.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace quire {

Status write_file_atomic(const std::string& path, const QByteArray& bytes) {
    const auto qpath = QString::fromStdString(path);
    QDir dir = QFileInfo(qpath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return Status::err(Error::transient("Cannot create directory for " + path, ErrorCode::Io));
    }

    QSaveFile file(qpath);
    if (!file.open(QIODevice::WriteOnly)) {
        return Status::err(Error::transient("Cannot open " + path + ": " +
                                            file.errorString().toStdString(), ErrorCode::Io));
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return Status::err(Error::transient("Short write to " + path, ErrorCode::Io));
    }
    if (!file.commit()) {
        return Status::err(Error::transient("Cannot commit " + path + ": " +
                                            file.errorString().toStdString(), ErrorCode::Io));
    }
    return Status::ok();
}

Res<QByteArray> read_file_bytes(const std::string& path) {
    QFile file(QString::fromStdString(path));
    if (!file.exists()) {
        return Res<QByteArray>::err(Error::structural(path + " does not exist", ErrorCode::NotFound));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Res<QByteArray>::err(Error::transient("Cannot read " + path + ": " +
                                                     file.errorString().toStdString(), ErrorCode::Io));
    }
    return Res<QByteArray>::ok(file.readAll());
}

} // namespace quire
