#pragma once
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

#include "configuration.h"
#include "sh1107/Builder.h"
#include "yaml-cpp/yaml.h"

enum portduino_log_level { level_error, level_warn, level_info, level_debug, level_trace };
enum display_bus_type { bus_i2c, bus_spi };

struct pinMapping {
    std::string config_section;
    std::string config_name;
    int pin = -1;
    int gpiochip;
    int line;
    bool enabled = false;
};

bool initGPIOPin(int pinNum, const std::string gpioChipName, int line);
bool loadConfig(const char *configPath);
void readGPIOFromYaml(YAML::Node sourceNode, pinMapping &destPin, int pinDefault = -1);

/**
 * Turn the Display section into a Builder.
 *
 * Returns false (and leaves out untouched) if Width/Height or Rotation name something the SH1107 modules don't come in.
 */
bool builderFromConfig(sh1107::Builder &out);

extern struct sh1107_config_struct {
    // Logging
    portduino_log_level logoutputlevel = level_info;
    bool ascii_logs = !isatty(1);
    bool ascii_logs_explicit = false;

    // Bus
    std::map<display_bus_type, std::string> busNames = {{bus_i2c, "i2c"}, {bus_spi, "spi"}};
    display_bus_type bus = bus_i2c;
    std::string i2cdev = "";
    int i2cAddress = SH1107_I2C_ADDRESS;
    std::string display_spi_dev = "";
    int spiSpeed = SH1107_SPI_FREQUENCY;

    // Panel
    int displayWidth = 128;
    int displayHeight = 64;
    int displayRotation = 0;
    int displayContrast = SH1107_DEFAULT_CONTRAST;
    int display_default_gpiochip = 0;
    pinMapping displayDC = {"Display", "DC", SH1107_DC};
    pinMapping displayCS = {"Display", "CS", SH1107_CS};
    pinMapping displayReset = {"Display", "Reset", SH1107_RESET};

    std::vector<pinMapping *> all_pins = {&displayDC, &displayCS, &displayReset};

    std::string emit_yaml()
    {
        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "Display" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "Bus" << YAML::Value << busNames[bus];
        if (bus == bus_i2c) {
            if (i2cdev != "")
                out << YAML::Key << "I2CDevice" << YAML::Value << i2cdev;
            out << YAML::Key << "I2CAddress" << YAML::Value << YAML::Hex << i2cAddress;
        } else {
            if (display_spi_dev != "")
                out << YAML::Key << "spidev" << YAML::Value << display_spi_dev.substr(5);
            out << YAML::Key << "spiSpeed" << YAML::Value << YAML::Dec << spiSpeed;
        }
        out << YAML::Key << "Width" << YAML::Value << YAML::Dec << displayWidth;
        out << YAML::Key << "Height" << YAML::Value << displayHeight;
        out << YAML::Key << "Rotation" << YAML::Value << displayRotation;
        if (displayContrast != SH1107_DEFAULT_CONTRAST)
            out << YAML::Key << "Contrast" << YAML::Value << YAML::Hex << displayContrast;

        for (auto display_pin : all_pins) {
            if (display_pin->enabled) {
                out << YAML::Key << display_pin->config_name << YAML::Value << YAML::BeginMap;
                out << YAML::Key << "pin" << YAML::Value << display_pin->pin;
                out << YAML::Key << "line" << YAML::Value << display_pin->line;
                out << YAML::Key << "gpiochip" << YAML::Value << display_pin->gpiochip;
                out << YAML::EndMap;
            }
        }
        out << YAML::EndMap; // Display

        out << YAML::Key << "Logging" << YAML::Value << YAML::BeginMap;
        switch (logoutputlevel) {
        case level_error:
            out << YAML::Key << "LogLevel" << YAML::Value << "error";
            break;
        case level_warn:
            out << YAML::Key << "LogLevel" << YAML::Value << "warn";
            break;
        case level_info:
            out << YAML::Key << "LogLevel" << YAML::Value << "info";
            break;
        case level_debug:
            out << YAML::Key << "LogLevel" << YAML::Value << "debug";
            break;
        case level_trace:
            out << YAML::Key << "LogLevel" << YAML::Value << "trace";
            break;
        }
        if (ascii_logs_explicit)
            out << YAML::Key << "AsciiLogs" << YAML::Value << ascii_logs;
        out << YAML::EndMap; // Logging

        out << YAML::EndMap;
        return out.c_str();
    }
} sh1107_config;
