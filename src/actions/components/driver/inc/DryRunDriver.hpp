#pragma once

#include "BrowserDriver.hpp"
#include <set>
#include <string>
#include <vector>

// Performs no browser I/O. Every call is logged and answered from fixtures:
//   texts:   selector -> text returned by get_text
//   attributes: selector -> mapping read by get_attribute
//   records: selector -> sequence returned by extract
//   scripts: script -> value returned by evaluate/execute_script
//   missing: selectors that are never found on the page
class DryRunDriver : public BrowserDriver {
public:
    struct Fixtures {
        ValueMap texts;
        ValueMap attributes;
        ValueMap records;
        ValueMap scripts;
        std::set<std::string> missing;
    };

    DryRunDriver() = default;
    explicit DryRunDriver(Fixtures fixtures);

    // Reads a YAML or JSON fixture file, throws std::runtime_error on failure
    static Fixtures load_fixtures(const std::string& path);
    static Fixtures parse_fixtures(const std::string& content);

    bool navigate(const std::string& url) override;
    bool click(const std::string& selector) override;
    bool type(const std::string& selector, const std::string& text) override;
    bool set_input_files(const std::string& selector, const std::string& path) override;
    bool hover(const std::string& selector) override;

    void wait(double seconds) override;
    bool wait_for(const std::string& selector, double timeout_seconds) override;

    std::optional<Value> extract(const std::string& selector, const Value& field_map) override;
    std::optional<Value> evaluate(const std::string& script) override;
    std::optional<Value> execute_script(const std::string& script) override;
    std::optional<std::string> get_text(const std::string& selector) override;
    std::optional<Value> get_attribute(const std::string& selector, const std::string& attribute) override;
    bool screenshot(const std::string& path) override;

    std::string last_error() const override { return last_error_; }
    void close() noexcept override;

    const std::string& current_url() const noexcept { return current_url_; }
    const std::vector<std::string>& calls() const noexcept { return calls_; }

    // Typed text per selector
    const ValueMap& inputs() const noexcept { return inputs_; }

    // Paths requested by screenshot, nothing is written
    const std::vector<std::string>& screenshots() const noexcept { return screenshots_; }

private:
    bool check_present(const std::string& selector);

    Fixtures fixtures_;
    std::string current_url_;
    std::string last_error_;
    std::vector<std::string> calls_;
    ValueMap inputs_;
    std::vector<std::string> screenshots_;
};
