#include "ImageHistory.h"
#include "ImageBuffer.h"
#include "core/ErrorHandling.h"
#include "core/Errors.h"
#include "core/Logger.h"
#include "core/Version.h"
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QTextStream>

void ImageHistory::reset(const ImageBuffer& original, const ImageBuffer* frame) {
    if (!original.isValid()) {
        throw Quasar::InvalidArgumentError("Cannot start a history from an invalid image");
    }
    clear();
    Snapshot orig = std::make_shared<const ImageBuffer>(original);
    m_images.push_back(orig);
    m_images.push_back(frame ? std::make_shared<const ImageBuffer>(*frame) : Snapshot());
    m_images.push_back(orig); // Working top; shares the original
    Logger::info(QString("History reset (%1x%2%3)")
                     .arg(original.width()).arg(original.height())
                     .arg(frame ? ", framed" : ""), "History");
}

void ImageHistory::clear() {
    m_images.clear();
    m_operations.clear();
}

void ImageHistory::pushOperation(const QString& label, const ImageBuffer& image, const ImageBuffer* frame) {
    if (!hasOriginal()) {
        throw Quasar::InvalidArgumentError("No image loaded");
    }
    if (!image.isValid()) {
        throw Quasar::InvalidArgumentError(QString("Operation '%1' produced an invalid image").arg(label));
    }

    Snapshot frameSnap = frame ? std::make_shared<const ImageBuffer>(*frame) : currentFrame();
    m_images.push_back(frameSnap);
    m_images.push_back(std::make_shared<const ImageBuffer>(image));

    Operation op;
    op.label = label;
    op.image = m_images.back();
    op.frame = frameSnap;
    op.imageIndex = imageCount() - 1;
    op.frameIndex = op.imageIndex - 1;
    m_operations.push_back(op);

    Logger::info(QString("Pushed operation #%1: %2").arg(operationCount()).arg(label), "History");
}

std::optional<ImageHistory::Operation> ImageHistory::popOperation() {
    if (m_operations.empty()) return std::nullopt;

    Operation op = m_operations.back();
    m_operations.pop_back();
    // Drop the operation image and its frame slot
    m_images.resize(op.frameIndex);

    Logger::info(QString("Cancelled operation: %1").arg(op.label), "History");
    return op;
}

ImageHistory::Snapshot ImageHistory::original() const {
    return m_images.empty() ? Snapshot() : m_images.front();
}

ImageHistory::Snapshot ImageHistory::current() const {
    return m_images.empty() ? Snapshot() : m_images.back();
}

ImageHistory::Snapshot ImageHistory::currentFrame() const {
    return m_images.size() < 2 ? Snapshot() : m_images[m_images.size() - 2];
}

ImageHistory::Snapshot ImageHistory::imageAt(int index) const {
    if (index < 0 || index >= imageCount()) {
        throw Quasar::InvalidArgumentError(QString("Image index %1 out of range [0, %2)").arg(index).arg(imageCount()));
    }
    return m_images[index];
}

QString ImageHistory::logs() const {
    QString text = QString("Quasar v%1\n").arg(Quasar::getVersion());
    for (const Operation& op : m_operations) {
        text += op.label + "\n";
    }
    return text;
}

QString ImageHistory::logPathFor(const QString& imagePath) {
    QFileInfo info(imagePath);
    return QDir(info.path()).filePath(info.completeBaseName() + ".log");
}

bool ImageHistory::saveLog(const QString& imagePath, QString* errorMsg) const {
    const QString path = logPathFor(imagePath);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        if (errorMsg) *errorMsg = formatError("Cannot write log", path, file.errorString());
        return false;
    }
    QTextStream out(&file);
    out << logs();
    out.flush();
    if (out.status() != QTextStream::Ok) {
        if (errorMsg) *errorMsg = formatError("Cannot write log", path, QString());
        return false;
    }
    Logger::info(QString("Operation log written to %1").arg(path), "History");
    return true;
}
