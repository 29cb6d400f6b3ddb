#include "DryRunDriver.hpp"
#include "DriverFactory.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

const char* kFixtures = R"(
texts:
  h1: Welcome
  ".price": 19.99
records:
  ".product":
    - {title: Laptop, price: 999, sku: A1}
    - {title: Mouse, price: 25, sku: B2}
scripts:
  "document.title": Shop
attributes:
  "a.next": {href: /page/2, rel: next}
missing:
  - "#captcha"
)";

}

void test_navigation_and_inputs() {
    DryRunDriver driver;
    assert(driver.navigate("https://shop.test"));
    assert(driver.current_url() == "https://shop.test");
    assert(!driver.navigate(""));
    assert(!driver.last_error().empty());

    assert(driver.type("#q", "laptop"));
    assert(driver.set_input_files("#upload", "/tmp/cv.pdf"));
    assert(driver.inputs().at("#q") == "laptop");
    assert(driver.inputs().at("#upload") == "/tmp/cv.pdf");
    assert(driver.calls().size() == 4);
    assert(driver.calls()[2] == "type #q");

    driver.close();
    assert(driver.current_url().empty());
    std::cout << "test_navigation_and_inputs passed.\n";
}

void test_fixture_answers() {
    DryRunDriver driver(DryRunDriver::parse_fixtures(kFixtures));

    assert(*driver.get_text("h1") == "Welcome");
    assert(*driver.get_text(".price") == "19.99");
    assert(driver.get_text("h2")->empty());

    assert(*driver.evaluate("document.title") == "Shop");
    assert(driver.execute_script("window.scrollTo(0, 0)")->is_null());

    auto all = driver.extract(".product", Value::object());
    assert(all->size() == 2);
    assert((*all)[1].at("sku") == "B2");

    auto projected = driver.extract(".product", Value{{"title", "h2"}, {"rating", ".stars"}});
    assert(projected->size() == 2);
    assert((*projected)[0].at("title") == "Laptop");
    assert((*projected)[0].at("rating").is_null());
    assert(!(*projected)[0].contains("sku"));

    assert(driver.extract(".none", Value::object())->empty());
    std::cout << "test_fixture_answers passed.\n";
}

void test_hover_attributes_and_screenshots() {
    DryRunDriver driver(DryRunDriver::parse_fixtures(kFixtures));

    assert(driver.hover("nav .menu"));
    assert(!driver.hover("#captcha"));
    assert(driver.last_error().find("#captcha") != std::string::npos);

    assert(*driver.get_attribute("a.next", "href") == "/page/2");
    assert(driver.get_attribute("a.next", "title")->is_null());
    assert(driver.get_attribute("h1", "class")->is_null());
    assert(!driver.get_attribute("#captcha", "src"));

    assert(driver.screenshot("shots/home.png"));
    assert(!driver.screenshot(""));
    assert((driver.screenshots() == std::vector<std::string>{"shots/home.png"}));
    assert(!std::filesystem::exists("shots/home.png"));
    std::cout << "test_hover_attributes_and_screenshots passed.\n";
}

void test_missing_selectors_fail() {
    DryRunDriver driver(DryRunDriver::parse_fixtures(kFixtures));

    assert(!driver.click("#captcha"));
    assert(driver.last_error().find("#captcha") != std::string::npos);
    assert(!driver.get_text("#captcha"));
    assert(!driver.extract("#captcha", Value::object()));
    assert(!driver.wait_for("#captcha", 2.5));
    assert(driver.last_error().find("Timed out") != std::string::npos);
    assert(driver.wait_for("h1", 2.5));
    assert(driver.click("#ok"));
    std::cout << "test_missing_selectors_fail passed.\n";
}

void test_invalid_fixtures() {
    for (const char* content : {"- a\n- b\n", "pages: {}\n", "missing: '#a'\n", "texts: [a]\n"}) {
        bool thrown = false;
        try {
            DryRunDriver::parse_fixtures(content);
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }
    assert(DryRunDriver::parse_fixtures("").texts.empty());
    std::cout << "test_invalid_fixtures passed.\n";
}

void test_factory() {
    const std::string path = "test_dry_run_fixtures.yaml";
    {
        std::ofstream out(path);
        out << kFixtures;
    }

    DriverConfig config;
    config.fixtures = path;
    auto driver = DriverFactory::create(config);
    assert(*driver->get_text("h1") == "Welcome");
    std::filesystem::remove(path);

    config.fixtures = "no_such_fixtures.yaml";
    bool thrown = false;
    try {
        DriverFactory::create(config);
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()).find("no_such_fixtures.yaml") != std::string::npos;
    }
    assert(thrown);

    config.type = "chrome";
    thrown = false;
    try {
        DriverFactory::create(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_factory passed.\n";
}

int main() {
    test_navigation_and_inputs();
    test_fixture_answers();
    test_hover_attributes_and_screenshots();
    test_missing_selectors_fail();
    test_invalid_fixtures();
    test_factory();

    std::cout << "All DryRunDriver tests passed!" << std::endl;
    return 0;
}
