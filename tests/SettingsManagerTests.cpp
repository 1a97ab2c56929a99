/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/Logger.hpp"
#include "effects/EffectsConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>

using namespace Stormfire;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile =
        (std::filesystem::temp_directory_path() / "stormfire_test_settings.json").string();

    SettingsTestFixture() {
        STORMFIRE_ENABLE_QUIET_MODE();
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        SettingsManager::Instance().clearAll();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
        file.close();
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("display", "width", 1920));
    BOOST_CHECK_EQUAL(settings.get<int>("display", "width", 0), 1920);

    // Default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("display", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("missiles", "explosion_duration", 0.6f));
    BOOST_CHECK_CLOSE(settings.get<float>("missiles", "explosion_duration", 0.0f), 0.6f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetStringAndBool) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("atmosphere", "initial", std::string("rain")));
    BOOST_CHECK(settings.set("display", "vsync", false));
    BOOST_CHECK(settings.set("atmosphere", "label", "storm"));

    BOOST_CHECK_EQUAL(settings.get<std::string>("atmosphere", "initial", ""), "rain");
    BOOST_CHECK_EQUAL(settings.get<std::string>("atmosphere", "label", ""), "storm");
    BOOST_CHECK_EQUAL(settings.get<bool>("display", "vsync", true), false);
}

BOOST_AUTO_TEST_CASE(TestHasAndRemove) {
    auto& settings = SettingsManager::Instance();

    settings.set("audio", "master_volume", 0.5f);
    BOOST_CHECK(settings.has("audio", "master_volume"));
    BOOST_CHECK(!settings.has("audio", "music_volume"));
    BOOST_CHECK(!settings.has("video", "master_volume"));

    BOOST_CHECK(settings.remove("audio", "master_volume"));
    BOOST_CHECK(!settings.has("audio", "master_volume"));
    BOOST_CHECK(!settings.remove("audio", "master_volume"));
}

BOOST_AUTO_TEST_CASE(TestCategoriesAndKeys) {
    auto& settings = SettingsManager::Instance();

    settings.set("missiles", "damage", 120);
    settings.set("missiles", "speed", 800);
    settings.set("ground_fire", "duration", 5.0f);

    auto categories = settings.getCategories();
    BOOST_CHECK_EQUAL(categories.size(), 2u);

    BOOST_CHECK_EQUAL(settings.getKeys("missiles").size(), 2u);
    BOOST_CHECK_EQUAL(settings.getKeys("nonexistent").size(), 0u);

    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({
  "display": {
    "width": 1920,
    "height": 1080,
    "vsync": true
  },
  "audio": {
    "master_volume": 0.8
  },
  "atmosphere": {
    "initial": "snow"
  }
})");

    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("display", "width", 0), 1920);
    BOOST_CHECK_EQUAL(settings.get<int>("display", "height", 0), 1080);
    BOOST_CHECK_EQUAL(settings.get<bool>("display", "vsync", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("audio", "master_volume", 0.0f), 0.8f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("atmosphere", "initial", ""), "snow");
}

BOOST_AUTO_TEST_CASE(TestWholeNumbersReadAsFloat) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({ "missiles": { "explosion_radius": 150, "max_flight_time": 5.0 } })");
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<float>("missiles", "explosion_radius", 0.0f), 150.0f);
    BOOST_CHECK_EQUAL(settings.get<float>("missiles", "max_flight_time", 0.0f), 5.0f);
    BOOST_CHECK_EQUAL(settings.get<int>("missiles", "explosion_radius", 0), 150);
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    auto& settings = SettingsManager::Instance();

    settings.set("display", "width", 1024);
    settings.set("display", "vsync", true);
    settings.set("audio", "master_volume", 0.9f);
    settings.set("atmosphere", "initial", std::string("petals"));

    BOOST_CHECK(settings.saveToFile(testFile));
    BOOST_CHECK(std::filesystem::exists(testFile));

    // Clear settings and reload to verify persistence
    settings.clearAll();
    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("display", "width", 0), 1024);
    BOOST_CHECK_EQUAL(settings.get<bool>("display", "vsync", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("audio", "master_volume", 0.0f), 0.9f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("atmosphere", "initial", ""), "petals");
}

BOOST_AUTO_TEST_CASE(TestLoadMergesIntoExistingValues) {
    auto& settings = SettingsManager::Instance();

    settings.set("display", "width", 800);
    settings.set("audio", "master_volume", 0.3f);
    createTestFile(R"({ "display": { "width": 1600 } })");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("display", "width", 0), 1600);
    BOOST_CHECK_CLOSE(settings.get<float>("audio", "master_volume", 0.0f), 0.3f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();
    settings.set("display", "width", 640);

    BOOST_CHECK(!settings.loadFromFile("nonexistent_file.json"));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    // Failed loads leave the store untouched
    BOOST_CHECK_EQUAL(settings.get<int>("display", "width", 0), 640);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "value", 42);
    settings.set("test", "ratio", 0.5f);

    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");
    // Floats never narrow to int
    BOOST_CHECK_EQUAL(settings.get<int>("test", "ratio", 7), 7);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();

    const int numThreads = 8;
    const int operationsPerThread = 100;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&settings, t, count = operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                std::string category = "category" + std::to_string(t);
                std::string key = "key" + std::to_string(i);
                settings.set(category, key, i * t);
                (void)settings.get<int>(category, key, -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Checks run on the main thread; Boost.Test assertions are not thread safe
    for (int t = 0; t < numThreads; ++t) {
        std::string category = "category" + std::to_string(t);
        for (int i = 0; i < operationsPerThread; ++i) {
            BOOST_CHECK_EQUAL(settings.get<int>(category, "key" + std::to_string(i), -1), i * t);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// EFFECTS CONFIG
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EffectsConfigTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestDefaultsWhenSettingsAreEmpty) {
    EffectsConfig config = EffectsConfig::fromSettings(SettingsManager::Instance());
    EffectsConfig defaults;

    BOOST_CHECK_EQUAL(config.atmosphere.rainCount, defaults.atmosphere.rainCount);
    BOOST_CHECK_EQUAL(config.missiles.damage, defaults.missiles.damage);
    BOOST_CHECK_EQUAL(config.missiles.explosionRadius, 150.0f);
    BOOST_CHECK_EQUAL(config.groundFire.damagePerSecond, 15.0f);
    BOOST_CHECK_CLOSE(config.groundFire.radiusScale, 0.8f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestValuesFromFile) {
    auto& settings = SettingsManager::Instance();
    createTestFile(R"({
  "atmosphere": { "rain_count": 200, "footprint_fade": 3 },
  "missiles": { "damage": 90, "explosion_duration": 0.8 },
  "ground_fire": { "damage_per_second": 25, "radius_scale": 0.5 }
})");
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    EffectsConfig config = EffectsConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.atmosphere.rainCount, 200);
    BOOST_CHECK_CLOSE(config.atmosphere.footprintFade, 3.0, 0.001);
    BOOST_CHECK_EQUAL(config.missiles.damage, 90.0f);
    BOOST_CHECK_CLOSE(config.missiles.explosionDuration, 0.8f, 0.001f);
    BOOST_CHECK_EQUAL(config.groundFire.damagePerSecond, 25.0f);
    BOOST_CHECK_CLOSE(config.groundFire.radiusScale, 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveValuesFallBack) {
    auto& settings = SettingsManager::Instance();
    settings.set("missiles", "speed", -100.0f);
    settings.set("atmosphere", "snow_count", 0);

    EffectsConfig config = EffectsConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.missiles.speed, 800.0f);
    BOOST_CHECK_EQUAL(config.atmosphere.snowCount, 600);
}

BOOST_AUTO_TEST_SUITE_END()
