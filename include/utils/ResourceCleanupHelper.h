#ifndef RESOURCECLEANUPHELPER_H
#define RESOURCECLEANUPHELPER_H

#include <QObject>

namespace PressHold {

class ResourceCleanupHelper {
public:
    ResourceCleanupHelper() = delete;

    // Disconnect all signals and delete right away (owning thread only)
    template<typename T>
    static void disconnectAndDestroy(T*& obj) {
        if (obj) {
            QObject::disconnect(obj, nullptr, nullptr, nullptr);
            delete obj;
            obj = nullptr;
        }
    }
};

} // namespace PressHold

#endif // RESOURCECLEANUPHELPER_H
