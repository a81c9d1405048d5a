#include "EditSession.h"
#include "algos/StretchOperator.h"
#include "core/Errors.h"
#include "core/Logger.h"
#include "io/ExternalEditor.h"
#include "io/ImageIO.h"
#include "scripting/PixelMath.h"
#include <QFileInfo>
#include <QDir>
#include <cmath>

EditSession::EditSession(const Settings& settings)
    : m_settings(settings)
{
}

void EditSession::requireImage() const {
    if (!hasImage()) throw Quasar::InvalidArgumentError("No image loaded");
}

const ImageBuffer& EditSession::image() const {
    requireImage();
    return *m_history.current();
}

// ============================================================================
// Files
// ============================================================================

bool EditSession::loadFile(const QString& path, QString* errorMsg) {
    ImageBuffer original;
    if (!ImageIO::load(path, original, errorMsg)) return false;

    const QFileInfo info(path);
    m_filename = info.absoluteFilePath();
    m_savename = QDir(info.path()).filePath(info.completeBaseName() + "-post." + info.suffix());

    // The frame of a framed image is the starting point that undo never pops
    if (original.checkFrame()) {
        const ImageBuffer frame = original.getFrame();
        Logger::info(QString("Image has a frame of type '%1'").arg(original.checkFrame()->type), "Frame");
        m_history.reset(original, &frame);
    } else {
        m_history.reset(original);
    }
    return true;
}

bool EditSession::saveFile(const QString& path, int depth, QString* errorMsg) {
    if (!hasImage()) {
        if (errorMsg) *errorMsg = "No image loaded";
        return false;
    }
    const QString target = path.isEmpty() ? m_savename : path;
    const int bits = depth > 0 ? depth : m_settings.defaultDepth;

    if (!ImageIO::save(target, image(), bits, m_settings.singleChannelGray, errorMsg)) return false;
    if (!m_history.saveLog(target, errorMsg)) return false;

    m_savename = QFileInfo(target).absoluteFilePath();
    return true;
}

// ============================================================================
// History
// ============================================================================

void EditSession::applyOperation(const QString& label, const ImageBuffer& image, const ImageBuffer* frame) {
    m_history.pushOperation(label, image, frame);
}

std::optional<ImageHistory::Operation> EditSession::cancelLastOperation() {
    if (!hasImage()) return std::nullopt;
    std::optional<ImageHistory::Operation> op = m_history.popOperation();
    if (!op) reportInfo("Cancel", "No operation to cancel");
    return op;
}

bool EditSession::runTool(const QString& label, const ToolSession::Job& job) {
    requireImage();
    ToolSession tool(image(), label.section('(', 0, 0));
    Result<ImageBuffer> result = tool.runSynchronously(job);
    if (result.isError()) {
        // Job exceptions reach the caller with their own type
        result.rethrowCause();
        throw Quasar::Error(result.error());
    }
    ImageBuffer output = result.take();
    if (!output.isValid()) {
        reportInfo(label, "Nothing to do");
        return false;
    }
    applyOperation(label, output);
    return true;
}

// ============================================================================
// Tools
// ============================================================================

bool EditSession::sharpen() {
    return runTool("Sharpen()", [](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        return ref.sharpened();
    });
}

bool EditSession::grayScale(const ChannelSelector& selector) {
    return runTool(QString("GrayScale(channel = %1)").arg(selector.label()),
                   [selector](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
                       return ref.grayScaled(selector);
                   });
}

bool EditSession::negative() {
    return runTool("Negative()", [](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        return ref.negated();
    });
}

bool EditSession::colorBalance(double red, double green, double blue) {
    const QString label = QString::asprintf("ColorBalance(R = %.2f, G = %.2f, B = %.2f)", red, green, blue);
    return runTool(label, [=](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        if (red == 1.0 && green == 1.0 && blue == 1.0) return ImageBuffer();
        return ref.colorBalanced(red, green, blue);
    });
}

bool EditSession::removeHotPixels(double ratio, const ChannelSelector& channels) {
    const QString label = QString::asprintf("RemoveHotPixels(channels = %s, ratio = %.2f)",
                                            qPrintable(channels.label()), ratio);
    return runTool(label, [=](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        return ref.hotPixelsRemoved(ratio, channels);
    });
}

bool EditSession::clipShadowsHighlights(std::optional<double> shadow, std::optional<double> highlight,
                                        const ChannelSelector& channels) {
    const QString label = QString("ClipShadowsHighlights(channels = %1, shadow = %2, highlight = %3)")
                              .arg(channels.label())
                              .arg(shadow ? QString::number(*shadow, 'f', 5) : QString("min"))
                              .arg(highlight ? QString::number(*highlight, 'f', 5) : QString("max"));
    return runTool(label, [=](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        return ref.clippedShadowsHighlights(shadow, highlight, channels);
    });
}

bool EditSession::resize(int width, int height, ImageBuffer::Resample resample) {
    return runTool(QString("Resample(size = %1x%2 pixels)").arg(width).arg(height),
                   [=](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
                       if (ref.width() == width && ref.height() == height) return ImageBuffer();
                       return ref.resized(width, height, resample);
                   });
}

bool EditSession::rescale(double scale, ImageBuffer::Resample resample) {
    requireImage();
    const ImageBuffer& current = image();
    const int width = static_cast<int>(std::lround(scale * current.width()));
    const int height = static_cast<int>(std::lround(scale * current.height()));
    return runTool(QString("Resample(size = %1x%2 pixels)").arg(width).arg(height),
                   [=](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
                       ImageBuffer scaled = ref.rescaled(scale, resample);
                       if (scaled.size() == ref.size()) return ImageBuffer();
                       return scaled;
                   });
}

bool EditSession::crop(int xmin, int xmax, int ymin, int ymax) {
    return runTool(QString("Crop(x = %1:%2, y = %3:%4)").arg(xmin).arg(xmax).arg(ymin).arg(ymax),
                   [=](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
                       return ref.cropped(xmin, xmax, ymin, ymax);
                   });
}

bool EditSession::stretch(const StretchOperator& op) {
    const int nlut = m_settings.lutSize;
    return runTool(op.label(), [op, nlut](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        ImageBuffer out(ref);
        if (!op.apply(out, true, nlut)) return ImageBuffer();
        return out;
    });
}

bool EditSession::removeFrame() {
    requireImage();
    ImageHistory::Snapshot f = frame();
    if (!f) {
        reportInfo("Remove frame", "The image has no frame");
        return false;
    }
    return runTool("RemoveFrame()", [f](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        return ref.frameRemoved(*f);
    });
}

bool EditSession::restoreFrame() {
    requireImage();
    ImageHistory::Snapshot f = frame();
    if (!f) {
        reportInfo("Restore frame", "The image has no frame");
        return false;
    }
    return runTool("RestoreFrame()", [f](const ImageBuffer& ref, const ToolSession::ContinueCheck&) {
        return ref.frameAdded(*f);
    });
}

int EditSession::operationImageIndex(int operation) const {
    if (operation < 0 || operation > m_history.operationCount()) {
        throw Quasar::InvalidArgumentError(QString("No image #%1 (%2 operation(s) in history)")
                                               .arg(operation).arg(m_history.operationCount()));
    }
    return operation == 0 ? 0 : m_history.operations()[operation - 1].imageIndex;
}

bool EditSession::pixelMath(const QString& expression, const std::vector<int>& indices, QString* errorMsg) {
    requireImage();

    std::vector<ImageHistory::Snapshot> bound;
    if (indices.empty()) {
        bound.push_back(m_history.current());
    } else {
        for (int k : indices) bound.push_back(m_history.imageAt(operationImageIndex(k)));
    }

    Scripting::PixelMath engine;
    std::vector<const ImageBuffer*> images;
    for (const auto& snap : bound) images.push_back(snap.get());
    engine.setImages(images);

    ImageBuffer output;
    if (!engine.evaluate(expression, output)) {
        if (errorMsg) *errorMsg = engine.lastError();
        return false;
    }
    applyOperation(QString("PixelMath(IMG = %1)").arg(expression), output);
    return true;
}

bool EditSession::externalEdit(const QString& commandTemplate, QString* errorMsg) {
    requireImage();
    const QString command = commandTemplate.isEmpty() ? m_settings.editorCommand : commandTemplate;

    Result<ExternalEditor::Outcome> result = ExternalEditor::run(image(), command, m_settings.editorExportDepth);
    if (result.isError()) {
        if (errorMsg) *errorMsg = result.error();
        reportUserError("External edit", result.error());
        return false;
    }
    ExternalEditor::Outcome outcome = result.take();
    if (outcome.kind == ExternalEditor::Outcome::Unchanged) return false;

    applyOperation(QString("Edit('%1')").arg(outcome.editor), outcome.image);
    return true;
}

QStringList EditSession::statisticsReport() const {
    QStringList lines;
    const QMap<QString, ImageBuffer::ChannelStats> stats = image().statistics();
    for (const QString& key : {QString("R"), QString("G"), QString("B"), QString("V"), QString("L")}) {
        const ImageBuffer::ChannelStats s = stats.value(key);
        const double n = s.npixels > 0 ? static_cast<double>(s.npixels) : 1.0;
        const QString median = s.median ? QString::number(*s.median, 'f', 5) : QString("None");
        lines << QString::asprintf("%s : min = %.5f, max = %.5f, med = %s, %lld (%.2f%%) zeros, %lld (%.2f%%) out-of-range",
                                   qPrintable(s.name), s.minimum, s.maximum, qPrintable(median),
                                   s.zerocount, 100.0 * s.zerocount / n, s.outcount, 100.0 * s.outcount / n);
    }
    return lines;
}
