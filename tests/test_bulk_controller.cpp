/**
 * @file test_bulk_controller.cpp
 * @brief Тесты групповых команд управления
 */

#include <gtest/gtest.h>

#include "control/bulk_controller.hpp"
#include "fakes.hpp"

namespace axectl::tests {

using control::BulkController;
using control::ControlAction;

namespace {

device::Device target(const std::string& name, const std::string& ip) {
    device::Device device;
    device.name = name;
    device.ip_address = ip;
    device.device_type = device::DeviceType::BitaxeGamma;
    device.status = device::DeviceStatus::Online;
    return device;
}

constexpr auto TIMEOUT = std::chrono::milliseconds(100);

} // anonymous namespace

TEST(ControlActionTest, Describe) {
    EXPECT_EQ(ControlAction::restart().describe(), "restart");
    EXPECT_EQ(ControlAction::set_fan(75).describe(), "set fan speed to 75%");
    EXPECT_EQ(ControlAction::update_settings({{"coreVoltage", 1150}, {"frequency", 525}}).describe(),
              "update settings (coreVoltage, frequency)");
}

/**
 * @brief Тест: процент вне диапазона отклоняется до любых запросов
 */
TEST(BulkControllerTest, RejectsFanPercentAbove100) {
    FakeDeviceClient client;
    BulkController controller(client);

    auto result = controller.run({target("bitaxe-1", "10.0.0.1")}, ControlAction::set_fan(101), TIMEOUT, 4);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
    EXPECT_TRUE(client.fan_speeds().empty());
}

TEST(BulkControllerTest, FanBoundaryValues) {
    FakeDeviceClient client;
    BulkController controller(client);

    ASSERT_TRUE(controller.run({target("a", "10.0.0.1")}, ControlAction::set_fan(0), TIMEOUT, 4).has_value());
    ASSERT_TRUE(controller.run({target("b", "10.0.0.2")}, ControlAction::set_fan(100), TIMEOUT, 4).has_value());

    auto speeds = client.fan_speeds();
    EXPECT_EQ(speeds.at("10.0.0.1"), 0u);
    EXPECT_EQ(speeds.at("10.0.0.2"), 100u);
}

/**
 * @brief Тест: сбой на одном устройстве не мешает остальным
 */
TEST(BulkControllerTest, RestartContinuesAfterFailure) {
    FakeDeviceClient client;
    client.fail_control("10.0.0.2");
    BulkController controller(client);

    std::vector<device::Device> devices{
        target("bitaxe-1", "10.0.0.1"),
        target("bitaxe-2", "10.0.0.2"),
        target("bitaxe-3", "10.0.0.3"),
    };

    auto result = controller.run(devices, ControlAction::restart(), TIMEOUT, 2);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 3u);

    // Порядок итогов совпадает с порядком входа
    EXPECT_TRUE((*result)[0].success);
    EXPECT_EQ((*result)[0].message, "bitaxe-1: restart ok");
    EXPECT_FALSE((*result)[1].success);
    EXPECT_EQ((*result)[1].message, "bitaxe-2: HTTP 500");
    EXPECT_EQ((*result)[1].device.ip_address, "10.0.0.2");
    EXPECT_TRUE((*result)[2].success);

    EXPECT_EQ(client.restarted().size(), 2u);
}

TEST(BulkControllerTest, SetFanMessage) {
    FakeDeviceClient client;
    auto result = BulkController(client).run({target("nerd-1", "10.0.0.7")}, ControlAction::set_fan(60), TIMEOUT, 1);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ(result->front().message, "nerd-1: set fan speed to 60% ok");
    EXPECT_EQ(client.fan_speeds().at("10.0.0.7"), 60u);
}

/**
 * @brief Тест: настройки передаются каждому устройству без изменений
 */
TEST(BulkControllerTest, UpdateSettingsPassesObjectThrough) {
    FakeDeviceClient client;
    client.fail_control("10.0.0.2");
    BulkController controller(client);

    nlohmann::json settings{{"frequency", 525}, {"coreVoltage", 1150}};
    auto result = controller.run({target("bitaxe-1", "10.0.0.1"), target("bitaxe-2", "10.0.0.2")},
                                 ControlAction::update_settings(settings), TIMEOUT, 2);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_TRUE((*result)[0].success);
    EXPECT_EQ((*result)[0].message, "bitaxe-1: update settings (coreVoltage, frequency) ok");
    EXPECT_FALSE((*result)[1].success);

    auto applied = client.applied_settings();
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_EQ(applied.at("10.0.0.1"), settings);
}

TEST(BulkControllerTest, RejectsSettingsThatAreNotAnObject) {
    FakeDeviceClient client;
    BulkController controller(client);

    auto array = controller.run({target("a", "10.0.0.1")},
                                ControlAction::update_settings(nlohmann::json::array({1, 2})), TIMEOUT, 1);
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().code, ErrorCode::ConfigInvalidValue);

    auto empty = controller.run({target("a", "10.0.0.1")},
                                ControlAction::update_settings(nlohmann::json::object()), TIMEOUT, 1);
    ASSERT_FALSE(empty.has_value());
    EXPECT_TRUE(client.applied_settings().empty());
}

TEST(BulkControllerTest, EmptyDeviceList) {
    FakeDeviceClient client;
    auto result = BulkController(client).run({}, ControlAction::restart(), TIMEOUT, 4);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

} // namespace axectl::tests
