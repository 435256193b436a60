// server/server_config.hpp
// Server configuration file handler
#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <fstream>
#include <stdexcept>
#include "logger.hpp"

struct ServerConfig {
    unsigned short port = 8090;
    std::string address = "0.0.0.0";
    std::uint64_t bodyLimit = 1024 * 1024;

    // Load configuration from file
    bool loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            Logger::config("Config file not found, creating default: " + filename);
            return createDefaultConfig(filename);
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip empty lines and comments
            if (line.empty() || line[0] == '#') continue;

            // Parse key=value pairs
            size_t equalsPos = line.find('=');
            if (equalsPos == std::string::npos) continue;

            std::string key = trim(line.substr(0, equalsPos));
            std::string value = trim(line.substr(equalsPos + 1));

            if (key == "port") {
                unsigned short parsed = 0;
                if (parsePort(value, parsed)) {
                    port = parsed;
                } else {
                    Logger::error("Invalid port value: " + value);
                }
            } else if (key == "address") {
                if (value.empty()) {
                    Logger::error("Empty address value, keeping " + address);
                } else {
                    address = value;
                }
            } else if (key == "body_limit") {
                try {
                    // stoull would wrap a leading '-' around to a huge limit
                    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                        throw std::invalid_argument(value);
                    }
                    size_t consumed = 0;
                    unsigned long long parsed = std::stoull(value, &consumed);
                    if (consumed != value.size() || parsed == 0) {
                        throw std::invalid_argument(value);
                    }
                    bodyLimit = parsed;
                } catch (const std::exception&) {
                    Logger::error("Invalid body_limit value: " + value);
                }
            } else {
                Logger::config("Ignoring unknown key: " + key);
            }
        }

        Logger::config("Configuration loaded from " + filename);
        return true;
    }

    // Create default configuration file
    bool createDefaultConfig(const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            Logger::error("Failed to create config file: " + filename);
            return false;
        }

        file << "# ReqEcho Server Configuration\n";
        file << "# Edit these settings to customize the listener\n\n";
        file << "# Port to listen on (default: 8090)\n";
        file << "port=" << port << "\n\n";
        file << "# Interface to bind, 0.0.0.0 for all (default: 0.0.0.0)\n";
        file << "address=" << address << "\n\n";
        file << "# Largest accepted request body in bytes (default: 1048576)\n";
        file << "body_limit=" << bodyLimit << "\n";

        Logger::config("Default configuration created: " + filename);
        return true;
    }

    // Accepts 1-65535, whole string must be digits
    static bool parsePort(const std::string& value, unsigned short& result) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size() || parsed < 1 || parsed > 65535) {
                return false;
            }
            result = static_cast<unsigned short>(parsed);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

private:
    // Helper function to trim whitespace
    static std::string trim(const std::string& str) {
        size_t start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }
};

#endif // SERVER_CONFIG_HPP
