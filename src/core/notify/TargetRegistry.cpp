#include "core/notify/TargetRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace cvn {

TargetRegistry::TargetRegistry(QObject* parent)
    : QObject(parent)
{
}

void TargetRegistry::upsert(std::shared_ptr<ITarget> target)
{
    if (!target) return;

    const QString id = target->id();
    const QString name = target->name();
    bool existed = false;
    {
        QWriteLocker locker(&lock_);
        existed = targets_.contains(id);
        targets_.insert(id, std::move(target));
    }

    if (existed) {
        BOOST_LOG_TRIVIAL(debug) << "[TargetRegistry] updated " << id.toStdString();
        emit targetUpdated(id, name);
    } else {
        BOOST_LOG_TRIVIAL(info) << "[TargetRegistry] added '" << name.toStdString()
                                << "' (" << id.toStdString() << ")";
        emit targetCreated(id, name);
    }
}

bool TargetRegistry::remove(const QString& id)
{
    {
        QWriteLocker locker(&lock_);
        if (targets_.remove(id) == 0)
            return false;
    }
    BOOST_LOG_TRIVIAL(info) << "[TargetRegistry] removed " << id.toStdString();
    emit targetRemoved(id);
    return true;
}

void TargetRegistry::clear()
{
    QStringList removed;
    {
        QWriteLocker locker(&lock_);
        removed = targets_.keys();
        targets_.clear();
    }
    for (const auto& id : removed)
        emit targetRemoved(id);
}

std::shared_ptr<ITarget> TargetRegistry::find(const QString& id) const
{
    QReadLocker locker(&lock_);
    return targets_.value(id);
}

std::shared_ptr<ITarget> TargetRegistry::findByName(const QString& name) const
{
    QReadLocker locker(&lock_);
    for (auto it = targets_.cbegin(); it != targets_.cend(); ++it) {
        if (it.value()->name().compare(name, Qt::CaseInsensitive) == 0)
            return it.value();
    }
    return nullptr;
}

std::shared_ptr<ITarget> TargetRegistry::resolve(const QString& idOrName) const
{
    if (auto target = find(idOrName))
        return target;
    return findByName(idOrName);
}

QStringList TargetRegistry::ids() const
{
    QReadLocker locker(&lock_);
    return targets_.keys();
}

std::vector<std::shared_ptr<ITarget>> TargetRegistry::targets() const
{
    QReadLocker locker(&lock_);
    std::vector<std::shared_ptr<ITarget>> result;
    result.reserve(targets_.size());
    for (const auto& t : targets_)
        result.push_back(t);
    return result;
}

int TargetRegistry::size() const
{
    QReadLocker locker(&lock_);
    return targets_.size();
}

} // namespace cvn
