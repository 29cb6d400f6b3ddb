#pragma once

#include "ActionBase.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

class ActionFactory {
public:
    using ActionCreator = std::function<std::unique_ptr<ActionBase>(ActionContext&)>;

    static ActionFactory& instance() {
        static ActionFactory factory;
        return factory;
    }

    void register_action(const std::string& name, ActionCreator creator) {
        std::lock_guard<std::mutex> lock(mutex_);
        creators_[name] = std::move(creator);
    }

    std::unique_ptr<ActionBase> create_action(const std::string& name, ActionContext& context) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = creators_.find(name); it != creators_.end()) {
            return it->second(context);
        }
        throw std::invalid_argument("Unsupported action type: " + name);
    }

    bool is_registered(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return creators_.count(name) > 0;
    }

private:
    std::unordered_map<std::string, ActionCreator> creators_;
    std::mutex mutex_;
};
