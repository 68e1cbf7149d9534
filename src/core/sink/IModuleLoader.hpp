#pragma once

#include <QMap>
#include <QString>
#include <cstdint>
#include <functional>

namespace rsb {

enum class LoadErrorKind {
    None,
    Unreachable,       // media server control channel down
    InvalidArguments,  // module rejected its properties
    LabelCollision     // a sink with this name already exists
};

struct LoadResult {
    LoadErrorKind kind = LoadErrorKind::None;
    uint32_t handle = 0;
    int errnoValue = 0;
    QString message;

    bool ok() const { return kind == LoadErrorKind::None; }
};

/// Abstract module loader for the media server, mocked in tests.
class IModuleLoader {
public:
    using Callback = std::function<void(const LoadResult&)>;

    virtual ~IModuleLoader() = default;

    virtual bool isAvailable() const = 0;

    /// Load moduleName with the given properties. The callback always runs
    /// from the Qt event loop, never re-entrantly.
    virtual void loadModule(const QString& moduleName,
                            const QMap<QString, QString>& properties,
                            Callback callback) = 0;
};

} // namespace rsb
