#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 */

#include "meridian/core/types.h"
#include "meridian/cluster/cluster_coordinator.h"
#include <string>
#include <vector>

namespace meridian::config {

/**
 * @brief Cluster configuration loaded from XML
 *
 * @code{.xml}
 * <cluster_config>
 *   <nodes count="4"/>
 *   <partitioning strategy="hash"/>
 *   <load_balancing strategy="work_stealing" threshold="0.8" min_imbalance="0.2"/>
 *   <messaging capacity="0"/>
 *   <logging level="info"/>
 * </cluster_config>
 * @endcode
 */
struct ClusterConfig {
    cluster::CoordinatorConfig coordinator;

    // Logging
    std::string log_level{"info"};
    std::string log_pattern;              ///< Empty keeps the spdlog default

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error on parse errors or invalid values
     */
    static ClusterConfig load(const std::string& path);

    /**
     * @brief Load configuration from an XML string
     * @throws std::runtime_error on parse errors or invalid values
     */
    static ClusterConfig load_from_string(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static ClusterConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;
};

/**
 * @brief Apply the logging section to the global spdlog logger
 * @throws std::runtime_error if the level name is unknown
 */
void apply_logging(const ClusterConfig& config);

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Load cluster configuration, resolving the path against the search paths
     */
    ClusterConfig load_cluster_config(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths, empty string if not found
     */
    std::string find_file(const std::string& filename) const;

private:
    std::vector<std::string> search_paths_;
};

} // namespace meridian::config
