#pragma once

#include "core/notify/ITarget.hpp"
#include <QObject>
#include <QHash>
#include <QReadWriteLock>
#include <QStringList>
#include <memory>
#include <vector>

namespace cvn {

/// Owned map target id -> target handle. Written by the discovery side on
/// the main thread; the worker and the trigger surface only read.
class TargetRegistry : public QObject {
    Q_OBJECT
public:
    explicit TargetRegistry(QObject* parent = nullptr);

    /// Insert or replace. Emits targetCreated for new ids, targetUpdated otherwise.
    void upsert(std::shared_ptr<ITarget> target);
    bool remove(const QString& id);
    void clear();

    std::shared_ptr<ITarget> find(const QString& id) const;
    std::shared_ptr<ITarget> findByName(const QString& name) const;
    /// Id first, then case-insensitive friendly name.
    std::shared_ptr<ITarget> resolve(const QString& idOrName) const;

    QStringList ids() const;
    std::vector<std::shared_ptr<ITarget>> targets() const;
    int size() const;

signals:
    void targetCreated(const QString& id, const QString& name);
    void targetUpdated(const QString& id, const QString& name);
    void targetRemoved(const QString& id);

private:
    mutable QReadWriteLock lock_;
    QHash<QString, std::shared_ptr<ITarget>> targets_;
};

} // namespace cvn
