#pragma once

#include <memory>
#include <string>
#include <vector>

namespace arcwalk::progress {

class Observer {
public:
    virtual ~Observer() = default;
    virtual void Update(const std::string& message) = 0;
};

using ObserverList = std::vector<std::shared_ptr<Observer>>;

// Forwards status lines to the console log.
class ConsoleObserver : public Observer {
public:
    void Update(const std::string& message) override;
};

// Delivers `message` to every observer. A throwing observer is logged and skipped.
void Notify(const ObserverList& observers, const std::string& message);

}  // namespace arcwalk::progress
