/**
 * @file i_system.hpp
 * @brief Interface for the per-frame ball systems
 */

#pragma once

#include <entt/entt.hpp>
#include "contraption/systems/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * The manager runs its systems in a fixed order every frame; each one sees
 * the registry after the previous one has finished.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry holding the balls
     * @param dt Frame time in seconds
     */
    virtual void update(entt::registry& registry, double dt) = 0;

    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Template for system-specific configurations
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
