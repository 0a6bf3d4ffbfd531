#include "config_loader.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// Helpers to convert strings to enums
RegisterAccess to_access(const std::string& s) {
    if (s == "RO") return RegisterAccess::ReadOnly;
    if (s == "RW") return RegisterAccess::ReadWrite;
    throw std::runtime_error("Invalid register access: " + s);
}

DataType to_type(const std::string& s) {
    if (s == "int16") return DataType::Int16;
    if (s == "uint16") return DataType::UInt16;
    if (s == "int32") return DataType::Int32;
    if (s == "uint32") return DataType::UInt32;
    if (s == "float32") return DataType::Float32;
    throw std::runtime_error("Invalid register type: " + s);
}

ValueKind to_kind(const std::string& s) {
    if (s == "number") return ValueKind::Number;
    if (s == "switch") return ValueKind::Switch;
    throw std::runtime_error("Invalid register kind: " + s);
}

PollerConfig parseConnection(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw std::runtime_error("Missing 'connection' section");
    }

    PollerConfig config;
    config.host = node["host"] ? node["host"].as<std::string>() : "";
    if (config.host.find_first_not_of(" \t") == std::string::npos) {
        throw std::runtime_error("connection.host must not be empty");
    }

    if (node["port"]) {
        int port = node["port"].as<int>();
        if (port < 1 || port > 65535) {
            throw std::runtime_error("connection.port must be 1-65535, got " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (node["unit_id"]) {
        int unit = node["unit_id"].as<int>();
        if (unit < 0 || unit > 247) {
            throw std::runtime_error("connection.unit_id must be 0-247, got " + std::to_string(unit));
        }
        config.unit_id = static_cast<uint8_t>(unit);
    }
    if (node["read_only"]) {
        config.read_only = node["read_only"].as<bool>();
    }
    if (node["scan_interval"]) {
        int seconds = node["scan_interval"].as<int>();
        if (seconds <= 0) {
            throw std::runtime_error("connection.scan_interval must be positive");
        }
        config.scan_interval = std::chrono::seconds(seconds);
    }
    if (node["timeout"]) {
        double seconds = node["timeout"].as<double>();
        if (!(seconds > 0.0)) {
            throw std::runtime_error("connection.timeout must be positive");
        }
        config.timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    }
    if (node["failure_threshold"]) {
        config.failure_threshold = node["failure_threshold"].as<int>();
        if (config.failure_threshold < 1) {
            throw std::runtime_error("connection.failure_threshold must be at least 1");
        }
    }
    return config;
}

Catalog::Entry parseRegister(const YAML::Node& node, std::map<std::string, double>& initial_values) {
    if (!node["key"] || !node["address"] || !node["type"]) {
        throw std::runtime_error("Every register needs 'key', 'address' and 'type'");
    }

    std::string key = node["key"].as<std::string>();
    RegisterDescriptor reg;
    reg.address = node["address"].as<uint16_t>();
    reg.type = to_type(node["type"].as<std::string>());
    reg.word_count = wordCountFor(reg.type);
    reg.scale = node["scale"] ? node["scale"].as<double>() : 1.0;
    reg.offset = node["offset"] ? node["offset"].as<double>() : 0.0;
    reg.access = node["access"] ? to_access(node["access"].as<std::string>()) : RegisterAccess::ReadOnly;
    reg.kind = node["kind"] ? to_kind(node["kind"].as<std::string>()) : ValueKind::Number;
    reg.name = node["name"] ? node["name"].as<std::string>() : key;
    reg.unit = node["unit"] ? node["unit"].as<std::string>() : "";

    bool has_min = static_cast<bool>(node["min"]);
    bool has_max = static_cast<bool>(node["max"]);
    if (has_min != has_max) {
        throw std::runtime_error("Register " + key + ": 'min' and 'max' must be given together");
    }
    if (has_min) {
        reg.range = ValidRange{node["min"].as<double>(), node["max"].as<double>()};
    }

    if (node["initial"]) {
        initial_values[key] = node["initial"].as<double>();
    }
    return {key, reg};
}

Profile parseRoot(const YAML::Node& root) {
    Profile profile;
    profile.config = parseConnection(root["connection"]);

    const auto& reg_nodes = root["registers"];
    if (!reg_nodes) {
        profile.catalog = Catalog::heliothermDefaults();
        return profile;
    }
    if (!reg_nodes.IsSequence() || reg_nodes.size() == 0) {
        throw std::runtime_error("'registers' must be a non-empty list");
    }

    std::vector<Catalog::Entry> entries;
    for (const auto& node : reg_nodes) {
        entries.push_back(parseRegister(node, profile.initial_values));
    }
    try {
        profile.catalog = std::make_shared<const Catalog>(std::move(entries));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid register table: ") + e.what());
    }
    return profile;
}

} // namespace

Profile ConfigLoader::loadProfile(const std::string& filename) {
    try {
        return parseRoot(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load profile " + filename + ": " + e.what());
    }
}

Profile ConfigLoader::parseProfile(const std::string& yaml) {
    try {
        return parseRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Cannot parse profile: ") + e.what());
    }
}
