#include "core/sink/PipeWireModuleLoader.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <pipewire/impl.h>

Q_LOGGING_CATEGORY(lcModuleLoader, "rsb.sink.pipewire")

namespace rsb {

namespace {
// Sink name property of the RAOP module; two sinks may not share it
constexpr const char* kSinkNameKey = "raop.name";
}

PipeWireModuleLoader::PipeWireModuleLoader(QObject* parent)
    : QObject(parent)
{
    pw_init(nullptr, nullptr);

    threadLoop_ = pw_thread_loop_new("rsb-modules", nullptr);
    if (!threadLoop_) {
        qCWarning(lcModuleLoader) << "[PipeWire] Failed to create thread loop";
        return;
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(threadLoop_), nullptr, 0);
    if (!context_) {
        qCWarning(lcModuleLoader) << "[PipeWire] Failed to create context";
        pw_thread_loop_destroy(threadLoop_);
        threadLoop_ = nullptr;
        return;
    }

    pw_thread_loop_lock(threadLoop_);
    const bool connected = connectCore();
    pw_thread_loop_unlock(threadLoop_);

    if (pw_thread_loop_start(threadLoop_) < 0) {
        qCWarning(lcModuleLoader) << "[PipeWire] Failed to start thread loop";
        disconnectCore();
        pw_context_destroy(context_); context_ = nullptr;
        pw_thread_loop_destroy(threadLoop_); threadLoop_ = nullptr;
        return;
    }

    if (connected)
        qCInfo(lcModuleLoader) << "[PipeWire] Connected to daemon";
    else
        qCWarning(lcModuleLoader) << "[PipeWire] Daemon not reachable, will retry on first load";
}

PipeWireModuleLoader::~PipeWireModuleLoader()
{
    // Requests still queued on the PipeWire loop are dropped, not run
    QSet<Request*> leftovers;
    {
        QMutexLocker lock(&mutex_);
        leftovers.swap(pending_);
    }

    if (threadLoop_) {
        pw_thread_loop_lock(threadLoop_);
        disconnectCore();
        pw_thread_loop_unlock(threadLoop_);
        pw_thread_loop_stop(threadLoop_);
    }

    if (context_)
        pw_context_destroy(context_);
    if (threadLoop_)
        pw_thread_loop_destroy(threadLoop_);

    qDeleteAll(leftovers);
    pw_deinit();
}

int PipeWireModuleLoader::loadedModuleCount() const
{
    QMutexLocker lock(&mutex_);
    return loaded_;
}

LoadErrorKind PipeWireModuleLoader::classifyErrno(int err)
{
    switch (std::abs(err)) {
    case 0:
        return LoadErrorKind::None;
    case EEXIST:
        return LoadErrorKind::LabelCollision;
    case EPIPE:
    case ECONNREFUSED:
    case ECONNRESET:
    case ENOTCONN:
    case EHOSTDOWN:
    case EAGAIN:
    case ETIMEDOUT:
        return LoadErrorKind::Unreachable;
    case ENOENT:
    case EINVAL:
    case ENOTSUP:
    default:
        return LoadErrorKind::InvalidArguments;
    }
}

QByteArray PipeWireModuleLoader::serializeProperties(const QMap<QString, QString>& properties)
{
    struct pw_properties* props = pw_properties_new(nullptr, nullptr);
    if (!props)
        return {};
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it)
        pw_properties_set(props, it.key().toUtf8().constData(), it.value().toUtf8().constData());

    char* buffer = nullptr;
    size_t size = 0;
    FILE* stream = open_memstream(&buffer, &size);
    if (!stream) {
        pw_properties_free(props);
        return {};
    }
    std::fputs("{", stream);
    pw_properties_serialize_dict(stream, &props->dict, 0);
    std::fputs(" }", stream);
    std::fclose(stream);

    QByteArray result(buffer, static_cast<int>(size));
    std::free(buffer);
    pw_properties_free(props);
    return result;
}

void PipeWireModuleLoader::loadModule(const QString& moduleName,
                                      const QMap<QString, QString>& properties,
                                      Callback callback)
{
    if (!threadLoop_) {
        LoadResult result;
        result.kind = LoadErrorKind::Unreachable;
        result.errnoValue = EHOSTDOWN;
        result.message = QStringLiteral("PipeWire is not available");
        deliver(callback, result);
        return;
    }

    auto* request = new Request{moduleName.toUtf8(), serializeProperties(properties),
                                properties.value(QString::fromLatin1(kSinkNameKey)),
                                std::move(callback)};
    {
        QMutexLocker lock(&mutex_);
        pending_.insert(request);
    }

    qCDebug(lcModuleLoader) << "[PipeWire] Loading" << moduleName << request->args;

    // The pointer itself is the payload; pw_loop_invoke copies it
    int res = pw_loop_invoke(pw_thread_loop_get_loop(threadLoop_), &PipeWireModuleLoader::invokeLoad,
                             SPA_ID_INVALID, &request, sizeof(request), false, this);
    if (res < 0) {
        {
            QMutexLocker lock(&mutex_);
            pending_.remove(request);
        }
        LoadResult result;
        result.kind = LoadErrorKind::Unreachable;
        result.errnoValue = -res;
        result.message = QStringLiteral("cannot queue load: %1").arg(QString::fromLocal8Bit(std::strerror(-res)));
        deliver(request->callback, result);
        delete request;
    }
}

int PipeWireModuleLoader::invokeLoad(struct spa_loop* /*loop*/, bool /*async*/, uint32_t /*seq*/,
                                     const void* data, size_t /*size*/, void* userData)
{
    auto* self = static_cast<PipeWireModuleLoader*>(userData);
    Request* request = *static_cast<Request* const*>(data);

    {
        QMutexLocker lock(&self->mutex_);
        if (!self->pending_.remove(request))
            return 0;  // loader is being destroyed
    }

    self->runLoad(request);
    delete request;
    return 0;
}

bool PipeWireModuleLoader::reserveSinkName(const QString& name)
{
    QMutexLocker lock(&mutex_);
    if (sinkNames_.contains(name))
        return false;
    sinkNames_.insert(name);
    return true;
}

void PipeWireModuleLoader::releaseSinkName(const QString& name)
{
    QMutexLocker lock(&mutex_);
    sinkNames_.remove(name);
}

void PipeWireModuleLoader::runLoad(Request* request)
{
    LoadResult result;
    const QString& sinkName = request->sinkName;

    if (!sinkName.isEmpty() && !reserveSinkName(sinkName)) {
        result.kind = LoadErrorKind::LabelCollision;
        result.errnoValue = EEXIST;
        result.message = QStringLiteral("sink name '%1' already in use").arg(sinkName);
        deliver(request->callback, result);
        return;
    }

    auto fail = [this, request, &result]() {
        if (!request->sinkName.isEmpty())
            releaseSinkName(request->sinkName);
        deliver(request->callback, result);
    };

    if (!connected_.load(std::memory_order_acquire)) {
        disconnectCore();
        if (!connectCore()) {
            result.kind = LoadErrorKind::Unreachable;
            result.errnoValue = errno != 0 ? errno : ECONNREFUSED;
            result.message = QStringLiteral("media server unreachable: %1")
                .arg(QString::fromLocal8Bit(std::strerror(result.errnoValue)));
            fail();
            return;
        }
        qCInfo(lcModuleLoader) << "[PipeWire] Reconnected to daemon";
    }

    errno = 0;
    struct pw_impl_module* module = pw_context_load_module(context_, request->moduleName.constData(),
                                                           request->args.constData(), nullptr);
    if (!module) {
        const int err = errno != 0 ? errno : EINVAL;
        result.kind = classifyErrno(err);
        result.errnoValue = err;
        result.message = QStringLiteral("%1: %2").arg(QString::fromUtf8(request->moduleName),
                                                      QString::fromLocal8Bit(std::strerror(err)));
        fail();
        return;
    }

    struct pw_global* global = pw_impl_module_get_global(module);
    result.handle = global ? pw_global_get_id(global) : SPA_ID_INVALID;
    {
        QMutexLocker lock(&mutex_);
        ++loaded_;
    }
    deliver(request->callback, result);
}

bool PipeWireModuleLoader::connectCore()
{
    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        const int err = errno;
        qCWarning(lcModuleLoader) << "[PipeWire] Failed to connect to daemon:" << std::strerror(err);
        errno = err;
        return false;
    }

    static const struct pw_core_events coreEvents = {
        .version = PW_VERSION_CORE_EVENTS,
        .error = onCoreError,
    };

    spa_zero(coreListener_);
    pw_core_add_listener(core_, &coreListener_, &coreEvents, this);
    connected_.store(true, std::memory_order_release);
    return true;
}

void PipeWireModuleLoader::disconnectCore()
{
    if (core_) {
        spa_hook_remove(&coreListener_);
        pw_core_disconnect(core_);
        core_ = nullptr;
    }
    connected_.store(false, std::memory_order_release);
}

void PipeWireModuleLoader::onCoreError(void* data, uint32_t id, int /*seq*/, int res, const char* message)
{
    auto* self = static_cast<PipeWireModuleLoader*>(data);
    if (id == PW_ID_CORE && res == -EPIPE) {
        // Core object is dead; reconnect lazily from the next load
        self->connected_.store(false, std::memory_order_release);
        qCWarning(lcModuleLoader) << "[PipeWire] Lost connection to daemon:" << message;
    } else {
        qCDebug(lcModuleLoader) << "[PipeWire] Core error on" << id << res << message;
    }
}

void PipeWireModuleLoader::deliver(const Callback& callback, const LoadResult& result)
{
    QMetaObject::invokeMethod(this, [callback, result]() {
        callback(result);
    }, Qt::QueuedConnection);
}

} // namespace rsb
