#include "arcwalk/progress.hpp"

#include "arcwalk/log.hpp"

#include <exception>

namespace arcwalk::progress {

void ConsoleObserver::Update(const std::string& message) {
    log::Info(message);
}

void Notify(const ObserverList& observers, const std::string& message) {
    for (const auto& observer : observers) {
        if (!observer) {
            continue;
        }
        try {
            observer->Update(message);
        } catch (const std::exception& exc) {
            log::Warn(std::string("Progress observer failed: ") + exc.what());
        }
    }
}

}  // namespace arcwalk::progress
