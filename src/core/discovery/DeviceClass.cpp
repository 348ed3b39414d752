#include "core/discovery/DeviceClass.hpp"

namespace cvn {

const QStringList& audioModels()
{
    static const QStringList models = {
        "Google Home", "Google Home Mini", "Google Nest Mini", "Google Nest Hub",
        "Google Nest Audio", "Nest Audio", "Home Mini", "Google Cast Group",
        "Lenovo Smart Clock",
    };
    return models;
}

bool isAudioModel(const QString& model)
{
    if (model.isEmpty())
        return false;
    for (const auto& candidate : audioModels()) {
        if (model.contains(candidate, Qt::CaseInsensitive))
            return true;
    }
    return false;
}

} // namespace cvn
