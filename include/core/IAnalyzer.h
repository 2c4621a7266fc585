#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace dae::core {

/**
 * @brief Base interface for every analyzer in the engine.
 *
 * Each concrete analyzer owns one kind of measurement (pitch, volume,
 * gesture energy, ...) and exposes a typed analyze() entry point of its own.
 * This base only carries the metadata and configuration lifecycle the
 * pipeline needs to treat analyzers uniformly.
 */
class IAnalyzer {
public:
    virtual ~IAnalyzer() = default;

    /**
     * @brief Returns the unique name of the analyzer (e.g., "Pitch").
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Returns the version string of the analyzer.
     */
    virtual std::string getVersion() const = 0;

    /**
     * @brief Applies configuration overrides.
     *
     * Missing keys keep their defaults, unknown keys are ignored.
     * @param config The analyzer-specific configuration object.
     * @return true on success, false if a value is out of range.
     */
    virtual bool initialize(const nlohmann::json& config) = 0;

    /**
     * @brief Restores the analyzer's default configuration.
     */
    virtual void reset() = 0;
};

} // namespace dae::core
