/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Cluster settings are read with pugixml. Missing elements and attributes
 * keep their defaults; present but invalid values are rejected.
 */

#include "meridian/interface/config.h"
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace meridian::config {

namespace {

// ============================================================================
// Enum Names
// ============================================================================

const char* partition_strategy_name(cluster::PartitionStrategy strategy) {
    switch (strategy) {
        case cluster::PartitionStrategy::RoundRobin: return "round_robin";
        case cluster::PartitionStrategy::Hash: return "hash";
        case cluster::PartitionStrategy::Range: return "range";
        case cluster::PartitionStrategy::LoadBalanced: return "load_balanced";
        case cluster::PartitionStrategy::Geographic: return "geographic";
        default: return "round_robin";
    }
}

const char* balance_strategy_name(cluster::LoadBalanceStrategy strategy) {
    switch (strategy) {
        case cluster::LoadBalanceStrategy::None: return "none";
        case cluster::LoadBalanceStrategy::Periodic: return "periodic";
        case cluster::LoadBalanceStrategy::Dynamic: return "dynamic";
        case cluster::LoadBalanceStrategy::WorkStealing: return "work_stealing";
        default: return "none";
    }
}

// ============================================================================
// Numeric Attributes
// ============================================================================

// The whole attribute value must parse; pugixml's as_* accessors accept
// prefixes and fall back to zero
template<typename T>
T parse_number(const pugi::xml_attribute& attr, const char* what) {
    std::string_view text = attr.as_string();
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        throw std::runtime_error(std::string("Invalid cluster config: ") + what +
                                 " is not a number: '" + attr.as_string() + "'");
    }
    return value;
}

Real parse_fraction(const pugi::xml_attribute& attr, Real fallback, const char* what) {
    if (!attr) {
        return fallback;
    }
    Real value = parse_number<Real>(attr, what);
    if (std::isnan(value) || value < 0.0 || value > 1.0) {
        throw std::runtime_error(std::string("Invalid cluster config: ") + what +
                                 " must be in [0, 1], got '" + attr.as_string() + "'");
    }
    return value;
}

ClusterConfig parse_document(const pugi::xml_document& doc) {
    ClusterConfig config = ClusterConfig::defaults();

    auto root = doc.child("cluster_config");
    if (!root) {
        root = doc.child("cluster");
    }
    if (!root) {
        throw std::runtime_error("Invalid cluster config XML: no root element");
    }

    auto& coord = config.coordinator;

    // Nodes
    if (auto nodes = root.child("nodes")) {
        if (auto attr = nodes.attribute("count")) {
            Int64 count = parse_number<Int64>(attr, "node count");
            if (count <= 0 || count > static_cast<Int64>(std::numeric_limits<UInt32>::max())) {
                throw std::runtime_error("Invalid cluster config: node count must be positive");
            }
            coord.num_nodes = static_cast<UInt32>(count);
        }
    }

    // Partitioning
    if (auto partitioning = root.child("partitioning")) {
        if (auto attr = partitioning.attribute("strategy")) {
            auto strategy = cluster::parse_partition_strategy(attr.as_string());
            if (!strategy) {
                throw std::runtime_error(std::string("Unknown partition strategy: ") + attr.as_string());
            }
            coord.partition_strategy = *strategy;
        }
    }

    // Load balancing
    if (auto balancing = root.child("load_balancing")) {
        if (auto attr = balancing.attribute("strategy")) {
            auto strategy = cluster::parse_load_balance_strategy(attr.as_string());
            if (!strategy) {
                throw std::runtime_error(std::string("Unknown load balance strategy: ") + attr.as_string());
            }
            coord.balance_strategy = *strategy;
        }
        coord.load_threshold = parse_fraction(balancing.attribute("threshold"),
                                              coord.load_threshold, "threshold");
        coord.min_imbalance = parse_fraction(balancing.attribute("min_imbalance"),
                                             coord.min_imbalance, "min_imbalance");
    }

    // Messaging
    if (auto messaging = root.child("messaging")) {
        if (auto attr = messaging.attribute("capacity")) {
            Int64 capacity = parse_number<Int64>(attr, "capacity");
            if (capacity < 0) {
                throw std::runtime_error("Invalid cluster config: capacity must not be negative");
            }
            coord.channel.capacity = static_cast<SizeT>(capacity);
        }
    }

    // Logging
    if (auto logging = root.child("logging")) {
        config.log_level = logging.attribute("level").as_string(config.log_level.c_str());
        config.log_pattern = logging.attribute("pattern").as_string(config.log_pattern.c_str());
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// ClusterConfig Implementation
// ============================================================================

ClusterConfig ClusterConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

ClusterConfig ClusterConfig::load_from_string(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }

    return parse_document(doc);
}

ClusterConfig ClusterConfig::defaults() {
    return ClusterConfig{};
}

bool ClusterConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("cluster_config");

    root.append_child("nodes").append_attribute("count") = coordinator.num_nodes;

    root.append_child("partitioning").append_attribute("strategy") =
        partition_strategy_name(coordinator.partition_strategy);

    auto balancing = root.append_child("load_balancing");
    balancing.append_attribute("strategy") = balance_strategy_name(coordinator.balance_strategy);
    balancing.append_attribute("threshold") = coordinator.load_threshold;
    balancing.append_attribute("min_imbalance") = coordinator.min_imbalance;

    root.append_child("messaging").append_attribute("capacity") =
        static_cast<unsigned long long>(coordinator.channel.capacity);

    auto logging = root.append_child("logging");
    logging.append_attribute("level") = log_level.c_str();
    if (!log_pattern.empty()) {
        logging.append_attribute("pattern") = log_pattern.c_str();
    }

    return doc.save_file(path.c_str());
}

void apply_logging(const ClusterConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && config.log_level != "off") {
        throw std::runtime_error("Unknown log level: " + config.log_level);
    }
    spdlog::set_level(level);

    if (!config.log_pattern.empty()) {
        spdlog::set_pattern(config.log_pattern);
    }
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

ClusterConfig ConfigLoader::load_cluster_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Cluster config file not found: " + path);
    }
    return ClusterConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace meridian::config
