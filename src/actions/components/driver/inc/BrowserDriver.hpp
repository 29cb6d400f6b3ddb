#pragma once

#include "Value.hpp"
#include <optional>
#include <string>

// Browser capability consumed by the leaf actions. Calls are synchronous;
// a failed call returns false or nullopt and leaves the reason in last_error().
class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    // Navigation and input
    virtual bool navigate(const std::string& url) = 0;
    virtual bool click(const std::string& selector) = 0;
    virtual bool type(const std::string& selector, const std::string& text) = 0;
    virtual bool set_input_files(const std::string& selector, const std::string& path) = 0;
    virtual bool hover(const std::string& selector) = 0;

    // Waiting
    virtual void wait(double seconds) = 0;
    virtual bool wait_for(const std::string& selector, double timeout_seconds) = 0;

    // Queries
    virtual std::optional<Value> extract(const std::string& selector, const Value& field_map) = 0;
    virtual std::optional<Value> evaluate(const std::string& script) = 0;
    virtual std::optional<Value> execute_script(const std::string& script) = 0;
    virtual std::optional<std::string> get_text(const std::string& selector) = 0;

    // null when the element exists but lacks the attribute
    virtual std::optional<Value> get_attribute(const std::string& selector, const std::string& attribute) = 0;

    virtual bool screenshot(const std::string& path) = 0;

    virtual std::string last_error() const = 0;
    virtual void close() noexcept = 0;
};
