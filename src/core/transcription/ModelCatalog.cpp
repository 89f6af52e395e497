#include "ModelCatalog.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QMutexLocker>
#include <algorithm>

namespace WhisperKit {

const QString ModelCatalog::DefaultUrlTemplate = QStringLiteral("{host}/{modelFileName}");

ModelCatalog::ModelCatalog(const QString& modelsPath)
    : modelsPath_(modelsPath) {
    for (ModelType type : {ModelType::Tiny, ModelType::Base, ModelType::Small,
                           ModelType::Medium, ModelType::LargeV1, ModelType::LargeV2}) {
        builtIn_.push_back(createDefaultDescriptor(type));
    }
}

std::optional<ModelDescriptor> ModelCatalog::find(const QString& name) const {
    auto byName = [&name](const ModelDescriptor& d) { return d.name() == name; };

    auto it = std::find_if(builtIn_.begin(), builtIn_.end(), byName);
    if (it != builtIn_.end()) {
        return *it;
    }

    QMutexLocker locker(&mutex_);
    auto customIt = std::find_if(custom_.begin(), custom_.end(), byName);
    if (customIt != custom_.end()) {
        return *customIt;
    }
    return std::nullopt;
}

ModelDescriptor ModelCatalog::descriptor(ModelType type) const {
    return builtIn_.at(static_cast<size_t>(type));
}

std::vector<ModelDescriptor> ModelCatalog::all() const {
    std::vector<ModelDescriptor> result = builtIn_;
    QMutexLocker locker(&mutex_);
    result.insert(result.end(), custom_.begin(), custom_.end());
    return result;
}

QStringList ModelCatalog::names() const {
    QStringList result;
    for (const auto& descriptor : all()) {
        result << descriptor.name();
    }
    return result;
}

bool ModelCatalog::addCustomModel(const ModelDescriptor& descriptor) {
    if (!descriptor.isValid()) {
        WHISPERKIT_WARN("Rejecting invalid custom model descriptor '{}'", descriptor.name().toStdString());
        return false;
    }
    if (find(descriptor.name()).has_value()) {
        WHISPERKIT_WARN("Model '{}' is already in the catalog", descriptor.name().toStdString());
        return false;
    }

    QMutexLocker locker(&mutex_);
    custom_.push_back(descriptor);
    WHISPERKIT_INFO("Custom model registered: {} -> {}",
                    descriptor.name().toStdString(), descriptor.localPath().toStdString());
    return true;
}

QString ModelCatalog::typeName(ModelType type) {
    switch (type) {
        case ModelType::Tiny: return QStringLiteral("tiny");
        case ModelType::Base: return QStringLiteral("base");
        case ModelType::Small: return QStringLiteral("small");
        case ModelType::Medium: return QStringLiteral("medium");
        case ModelType::LargeV1: return QStringLiteral("large-v1");
        case ModelType::LargeV2: return QStringLiteral("large-v2");
    }
    return QStringLiteral("base");
}

QString ModelCatalog::fileNameFor(const QString& modelName) {
    return QStringLiteral("ggml-%1.bin").arg(modelName);
}

ModelDescriptor ModelCatalog::createDefaultDescriptor(ModelType type) const {
    const QString name = typeName(type);
    const QString fileName = fileNameFor(name);

    // Published sizes differ between mirrors, so the built-in entries rely on
    // Content-Length and the magic check instead of a fixed size.
    return ModelDescriptor(name,
                           0,
                           DefaultUrlTemplate,
                           fileName,
                           QDir(modelsPath_).filePath(fileName));
}

} // namespace WhisperKit
