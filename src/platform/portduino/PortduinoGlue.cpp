#include "PortduinoGPIO.h"
#include "SerialConsole.h"
#include "configuration.h"

#include "PortduinoGlue.h"
#include "linux/gpio/LinuxGPIOPin.h"
#include <SPI.h>
#include <Utility.h>
#include <argp.h>
#include <iostream>
#include <unistd.h>

#ifdef PORTDUINO_LINUX_HARDWARE
#include <cxxabi.h>
#endif

sh1107_config_struct sh1107_config;
char *configPath = nullptr;
bool verboseEnabled = false;
bool yamlOnly = false;

const char *argp_program_version = optstr(APP_VERSION);

char stdoutBuffer[512];

static error_t parse_opt(int key, char *arg, struct argp_state *state)
{
    switch (key) {
    case 'c':
        configPath = arg;
        break;
    case 'v':
        verboseEnabled = true;
        break;
    case 'y':
        yamlOnly = true;
        break;
    case ARGP_KEY_ARG:
        return 0;
    default:
        return ARGP_ERR_UNKNOWN;
    }
    return 0;
}

void portduinoCustomInit()
{
    static struct argp_option options[] = {{"config", 'c', "CONFIG_PATH", 0, "Full path of the .yaml config file to use."},
                                           {"verbose", 'v', 0, 0, "Set log level to full debug"},
                                           {"output-yaml", 'y', 0, 0, "Output config yaml and exit"},
                                           {0}};
    static void *childArguments;
    static char doc[] = "SH1107 OLED driver, Linux build.";
    static char args_doc[] = "...";
    static struct argp argp = {options, parse_opt, args_doc, doc, 0, 0, 0};
    const struct argp_child child = {&argp, OPTION_ARG_OPTIONAL, 0, 0};
    portduinoAddArguments(child, childArguments);
}

/** apps run under portduino can optionally define a portduinoSetup() to
 * use portduino specific init code (such as gpioBind) to setup portduino on their host machine,
 * before running 'arduino' code.
 */
void portduinoSetup()
{
    int max_GPIO = 0;
    std::string gpioChipName = "gpiochip";

    // Force stdout to be line buffered
    setvbuf(stdout, stdoutBuffer, _IOLBF, sizeof(stdoutBuffer));

    if (configPath != nullptr) {
        if (loadConfig(configPath)) {
            if (!yamlOnly)
                std::cout << "Using " << configPath << " as config file" << std::endl;
        } else {
            std::cout << "Unable to use " << configPath << " as config file" << std::endl;
            exit(EXIT_FAILURE);
        }
    } else if (access("config.yaml", R_OK) == 0) {
        if (loadConfig("config.yaml")) {
            if (!yamlOnly)
                std::cout << "Using local config.yaml as config file" << std::endl;
        } else {
            std::cout << "Unable to use local config.yaml as config file" << std::endl;
            exit(EXIT_FAILURE);
        }
    } else if (access("/etc/sh1107/config.yaml", R_OK) == 0) {
        if (loadConfig("/etc/sh1107/config.yaml")) {
            if (!yamlOnly)
                std::cout << "Using /etc/sh1107/config.yaml as config file" << std::endl;
        } else {
            std::cout << "Unable to use /etc/sh1107/config.yaml as config file" << std::endl;
            exit(EXIT_FAILURE);
        }
    } else if (!yamlOnly) {
        std::cout << "No 'config.yaml' found, using built in defaults" << std::endl;
    }

    if (yamlOnly) {
        std::cout << sh1107_config.emit_yaml() << std::endl;
        exit(EXIT_SUCCESS);
    }

    if (verboseEnabled && sh1107_config.logoutputlevel != level_trace) {
        sh1107_config.logoutputlevel = level_debug;
    }

    // The console picks its colour setting from the config, so only create it once that is loaded
    consoleInit();

    for (auto i : sh1107_config.all_pins) {
        if (i->enabled && i->pin > max_GPIO)
            max_GPIO = i->pin;
    }

    gpioInit(max_GPIO + 1); // Done here so we can inform Portduino how many GPIOs we need.

    // Need to bind all the configured GPIO pins so they're not simulated
    for (auto i : sh1107_config.all_pins) {
        if (i->enabled) {
            if (!initGPIOPin(i->pin, gpioChipName + std::to_string(i->gpiochip), i->line)) {
                printf("Error setting pin number %d. It may not exist, or may already be in use.\n", i->line);
                exit(EXIT_FAILURE);
            }
        }
    }

    if (sh1107_config.bus == bus_spi && sh1107_config.display_spi_dev != "") {
        SPI.begin(sh1107_config.display_spi_dev.c_str());
    }
}

bool initGPIOPin(int pinNum, const std::string gpioChipName, int line)
{
#ifdef PORTDUINO_LINUX_HARDWARE
    std::string gpio_name = "GPIO" + std::to_string(pinNum);
    std::cout << "Initializing " << gpio_name << " on chip " << gpioChipName << std::endl;
    try {
        GPIOPin *pin;
        pin = new LinuxGPIOPin(pinNum, gpioChipName.c_str(), line, gpio_name.c_str());
        pin->setSilent();
        gpioBind(pin);
        return true;
    } catch (...) {
        const std::type_info *t = abi::__cxa_current_exception_type();
        std::cout << "Warning, cannot claim pin " << gpio_name << (t ? t->name() : "null") << std::endl;
        return false;
    }
#else
    return true;
#endif
}

bool loadConfig(const char *configPath)
{
    YAML::Node yamlConfig;
    try {
        yamlConfig = YAML::LoadFile(configPath);
        if (yamlConfig["Logging"]) {
            if (yamlConfig["Logging"]["LogLevel"].as<std::string>("info") == "trace") {
                sh1107_config.logoutputlevel = level_trace;
            } else if (yamlConfig["Logging"]["LogLevel"].as<std::string>("info") == "debug") {
                sh1107_config.logoutputlevel = level_debug;
            } else if (yamlConfig["Logging"]["LogLevel"].as<std::string>("info") == "info") {
                sh1107_config.logoutputlevel = level_info;
            } else if (yamlConfig["Logging"]["LogLevel"].as<std::string>("info") == "warn") {
                sh1107_config.logoutputlevel = level_warn;
            } else if (yamlConfig["Logging"]["LogLevel"].as<std::string>("info") == "error") {
                sh1107_config.logoutputlevel = level_error;
            }
            if (yamlConfig["Logging"]["AsciiLogs"]) {
                // Default is !isatty(1) but can be set explicitly in config.yaml
                sh1107_config.ascii_logs = yamlConfig["Logging"]["AsciiLogs"].as<bool>();
                sh1107_config.ascii_logs_explicit = true;
            }
        }
        if (yamlConfig["Display"]) {
            if (yamlConfig["Display"]["Bus"]) {
                bool known = false;
                for (auto &busName : sh1107_config.busNames) {
                    if (yamlConfig["Display"]["Bus"].as<std::string>("") == busName.second) {
                        sh1107_config.bus = busName.first;
                        known = true;
                    }
                }
                if (!known) {
                    std::cout << "*** Unknown Display Bus " << yamlConfig["Display"]["Bus"].as<std::string>("") << std::endl;
                    return false;
                }
            }
            sh1107_config.i2cdev = yamlConfig["Display"]["I2CDevice"].as<std::string>("");
            sh1107_config.i2cAddress = yamlConfig["Display"]["I2CAddress"].as<int>(SH1107_I2C_ADDRESS);
            if (yamlConfig["Display"]["spidev"]) {
                sh1107_config.display_spi_dev = "/dev/" + yamlConfig["Display"]["spidev"].as<std::string>("spidev0.0");
            }
            sh1107_config.spiSpeed = yamlConfig["Display"]["spiSpeed"].as<int>(SH1107_SPI_FREQUENCY);

            sh1107_config.displayWidth = yamlConfig["Display"]["Width"].as<int>(128);
            sh1107_config.displayHeight = yamlConfig["Display"]["Height"].as<int>(64);
            sh1107_config.displayRotation = yamlConfig["Display"]["Rotation"].as<int>(0);
            sh1107_config.displayContrast = yamlConfig["Display"]["Contrast"].as<int>(SH1107_DEFAULT_CONTRAST);

            // set gpiochip once for all the display pins
            sh1107_config.display_default_gpiochip = yamlConfig["Display"]["gpiochip"].as<int>(0);
            for (auto this_pin : sh1107_config.all_pins) {
                readGPIOFromYaml(yamlConfig["Display"][this_pin->config_name], *this_pin);
            }
        }
    } catch (YAML::Exception &e) {
        std::cout << "*** Exception " << e.what() << std::endl;
        return false;
    }
    return true;
}

void readGPIOFromYaml(YAML::Node sourceNode, pinMapping &destPin, int pinDefault)
{
    if (sourceNode.IsMap()) {
        destPin.enabled = true;
        destPin.pin = sourceNode["pin"].as<int>(pinDefault);
        destPin.line = sourceNode["line"].as<int>(destPin.pin);
        destPin.gpiochip = sourceNode["gpiochip"].as<int>(sh1107_config.display_default_gpiochip);
    } else if (sourceNode) { // plain pin number
        destPin.enabled = true;
        destPin.pin = sourceNode.as<int>(pinDefault);
        destPin.line = destPin.pin;
        destPin.gpiochip = sh1107_config.display_default_gpiochip;
    }
}

bool builderFromConfig(sh1107::Builder &out)
{
    sh1107::DisplaySize size;
    sh1107::DisplayRotation rotation;

    if (!sh1107::sizeFromDimensions(sh1107_config.displayWidth, sh1107_config.displayHeight, size)) {
        LOG_ERROR("Unsupported SH1107 panel %dx%d", sh1107_config.displayWidth, sh1107_config.displayHeight);
        return false;
    }
    if (!sh1107::rotationFromDegrees(sh1107_config.displayRotation, rotation)) {
        LOG_ERROR("Rotation must be 0, 90, 180 or 270, not %d", sh1107_config.displayRotation);
        return false;
    }
    if (sh1107_config.i2cAddress < 0 || sh1107_config.i2cAddress > 0x7F) {
        LOG_ERROR("I2C address 0x%x out of range", sh1107_config.i2cAddress);
        return false;
    }

    out = sh1107::Builder().withSize(size).withRotation(rotation).withI2cAddr((uint8_t)sh1107_config.i2cAddress);
    return true;
}
