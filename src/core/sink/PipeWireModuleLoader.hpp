#pragma once

#include "core/sink/IModuleLoader.hpp"
#include <QMutex>
#include <QObject>
#include <QSet>
#include <atomic>
#include <pipewire/pipewire.h>

namespace rsb {

/// Loads PipeWire modules into an in-process context.
///
/// Owns a pw_thread_loop, a pw_context and the connection to the daemon.
/// Loads are handed to the PipeWire thread with pw_loop_invoke and the result
/// is posted back to the Qt thread. A daemon that is not running at startup
/// or goes away later is not fatal: the next load tries to reconnect and
/// reports Unreachable if that fails.
///
/// Modules are never unloaded by this class. They belong to the in-process
/// context, so every sink created here shares the lifetime of the process
/// and disappears when it exits.
class PipeWireModuleLoader : public QObject, public IModuleLoader {
    Q_OBJECT
public:
    explicit PipeWireModuleLoader(QObject* parent = nullptr);
    ~PipeWireModuleLoader() override;

    /// Thread loop and context exist.
    bool isAvailable() const override { return threadLoop_ != nullptr; }
    /// Core connection to the daemon is up.
    bool isConnected() const { return connected_.load(std::memory_order_acquire); }

    void loadModule(const QString& moduleName,
                    const QMap<QString, QString>& properties,
                    Callback callback) override;

    int loadedModuleCount() const;

    /// Sink names (raop.name) are unique per loader. A load whose name is
    /// taken fails with LabelCollision before PipeWire is involved; a failed
    /// load gives its name back.
    bool reserveSinkName(const QString& name);
    void releaseSinkName(const QString& name);

    static LoadErrorKind classifyErrno(int err);

    /// SPA-JSON object built with pw_properties_serialize_dict, the form
    /// pw_context_load_module expects for its args.
    static QByteArray serializeProperties(const QMap<QString, QString>& properties);

private:
    struct Request {
        QByteArray moduleName;
        QByteArray args;
        QString sinkName;
        Callback callback;
    };

    // PipeWire thread only
    bool connectCore();
    void disconnectCore();
    void runLoad(Request* request);

    static int invokeLoad(struct spa_loop* loop, bool async, uint32_t seq,
                          const void* data, size_t size, void* userData);
    static void onCoreError(void* data, uint32_t id, int seq, int res, const char* message);

    void deliver(const Callback& callback, const LoadResult& result);

    struct pw_thread_loop* threadLoop_ = nullptr;
    struct pw_context* context_ = nullptr;
    struct pw_core* core_ = nullptr;
    struct spa_hook coreListener_{};
    std::atomic<bool> connected_{false};

    mutable QMutex mutex_;
    QSet<Request*> pending_;     // guarded by mutex_
    QSet<QString> sinkNames_;    // guarded by mutex_
    int loaded_ = 0;             // guarded by mutex_
};

} // namespace rsb
