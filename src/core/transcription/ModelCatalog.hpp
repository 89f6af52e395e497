#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QMutex>
#include <optional>
#include <vector>

#include "TranscriptionTypes.hpp"

namespace WhisperKit {

enum class ModelType {
    Tiny,
    Base,
    Small,
    Medium,
    LargeV1,
    LargeV2
};

/**
 * @brief The fixed set of model variants known at startup.
 *
 * Every descriptor points at <modelsPath>/ggml-<name>.bin and downloads from
 * "{host}/{modelFileName}". Custom descriptors can be added for self-hosted
 * weights; built-in entries cannot be replaced.
 */
class ModelCatalog {
public:
    static const QString DefaultUrlTemplate;

    explicit ModelCatalog(const QString& modelsPath);

    const QString& modelsPath() const { return modelsPath_; }

    std::optional<ModelDescriptor> find(const QString& name) const;
    ModelDescriptor descriptor(ModelType type) const;
    std::vector<ModelDescriptor> all() const;
    QStringList names() const;

    bool addCustomModel(const ModelDescriptor& descriptor);

    static QString typeName(ModelType type);
    static QString fileNameFor(const QString& modelName);

private:
    ModelDescriptor createDefaultDescriptor(ModelType type) const;

    QString modelsPath_;
    std::vector<ModelDescriptor> builtIn_;
    std::vector<ModelDescriptor> custom_;
    mutable QMutex mutex_;
};

} // namespace WhisperKit
