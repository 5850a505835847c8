// include/line_ngin/optimization/parameter_space.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/simulation_params.hpp"

namespace line_ngin {
namespace optimization {

/**
 * @brief Values tried for one SimulationParams field
 */
struct ParameterAxis {
    ParamField field{ParamField::SPREAD_SHRINKAGE};
    std::vector<double> values;
};

/**
 * @brief Cartesian product of named axes applied on top of a baseline
 */
class ParameterGrid {
public:
    ParameterGrid() = default;
    explicit ParameterGrid(std::string name) : name_(std::move(name)) {}

    ParameterGrid& add_axis(ParamField field, std::vector<double> values);

    /**
     * @brief Every combination of axis values, fields not on an axis taken from the baseline
     * @return Combinations in axis order (first axis outermost), or INVALID_ARGUMENT for an
     *         empty axis or a field listed twice
     */
    Result<std::vector<SimulationParams>> expand(const SimulationParams& baseline) const;

    size_t size() const;

    const std::string& name() const {
        return name_;
    }
    const std::vector<ParameterAxis>& axes() const {
        return axes_;
    }

private:
    std::string name_;
    std::vector<ParameterAxis> axes_;
};

/**
 * @brief Ordered set of grids evaluated as one search
 */
class ParameterSpace {
public:
    ParameterSpace& add_grid(ParameterGrid grid);

    /**
     * @brief Baseline first, then every grid in order, identical tuples kept once
     */
    Result<std::vector<SimulationParams>> expand(const SimulationParams& baseline) const;

    const std::vector<ParameterGrid>& grids() const {
        return grids_;
    }

    /**
     * @brief Single-axis sweeps, paired sweeps and a refinement grid over shrinkage,
     *        rating cap and maximum spread
     */
    static ParameterSpace default_search_plan();

    /**
     * @brief Weather coefficient sweep for outdoor sports
     */
    static ParameterSpace weather_search_plan();

private:
    std::vector<ParameterGrid> grids_;
};

struct FieldTolerance {
    ParamField field{ParamField::SPREAD_SHRINKAGE};
    double tolerance{0.0};
};

/**
 * @brief Treats two configurations as the same when every listed field differs by less
 *        than its tolerance
 */
class NearDuplicateFilter {
public:
    explicit NearDuplicateFilter(std::vector<FieldTolerance> tolerances);

    /**
     * @brief shrinkage 0.05, rating cap 1, max spread 1
     */
    static NearDuplicateFilter defaults();

    bool is_near_duplicate(const SimulationParams& a, const SimulationParams& b) const;

    const std::vector<FieldTolerance>& tolerances() const {
        return tolerances_;
    }

private:
    std::vector<FieldTolerance> tolerances_;
};

}  // namespace optimization
}  // namespace line_ngin
