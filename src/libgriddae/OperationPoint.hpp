// =============================================================================
//  GridDAE
//  
//  Copyright © 2023-present: The GridDAE Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file 
 * Searches operating points of power grids
 */

#ifndef LIBGRIDDAE_OPERATIONPOINT_HPP_
#define LIBGRIDDAE_OPERATIONPOINT_HPP_

#include "State.hpp"

#include <vector>

namespace griddae
{

class PowerGrid;
class ModelFactory;
class IParameterProvider;

/**
 * @brief Default error tolerance of operating point searches
 */
constexpr double defaultOperationPointTolerance = 1e-9;

/**
 * @brief Computes the initial guess of an operating point search
 * @details The reference voltage is taken from the first slack node (@c 1 + 0i with a warning
 *          if there is none). Each node fills its block using the guess function registered for its
 *          type in @p factory: by default the voltage is set to the reference voltage and all other
 *          variables to @c 0.
 * @param [in] grid Power grid
 * @param [in] factory Registry of guess functions
 * @return Initial guess
 * @throws AssertionError if a slack node has a voltage different from the reference voltage
 * @throws UnsupportedNodeTypeError if a node has no voltage state
 */
std::vector<double> initialGuess(const PowerGrid& grid, const ModelFactory& factory);

/**
 * @brief Computes the initial guess using the built-in guess functions
 */
std::vector<double> initialGuess(const PowerGrid& grid);

/**
 * @brief Finds a fixed point @f$ f(u) = 0 @f$ of the grid dynamics using dense Jacobians
 * @details Logs a warning if the grid has no slack node. The nonlinear solver is selected by
 *          @c NONLIN_SOLVER in @p config (default: error based trust region Newton method followed
 *          by Levenberg-Marquardt) and tuned by its parameters. The solution is accepted if its residual
 *          (max norm) does not exceed @c RESIDUAL_TOLERANCE (default @c 1e-6).
 * @param [in] grid Power grid
 * @param [in] guess Initial guess or @c nullptr for initialGuess()
 * @param [in] tol Error tolerance of the nonlinear solver
 * @param [in] config Solver configuration or @c nullptr for defaults
 * @return Operating point
 * @throws UnsupportedNodeTypeError before solving if a node does not support operating points
 * @throws DimensionError if the guess has the wrong length
 * @throws OperationPointError if the nonlinear solver fails
 */
State findOperationPoint(const PowerGrid& grid, std::vector<double> const* guess = nullptr, double tol = defaultOperationPointTolerance,
	IParameterProvider* config = nullptr);

/**
 * @brief Finds a fixed point of the grid dynamics using sparse Jacobians
 * @details The Jacobian is computed by column-compressed AD and factorized by the Eigen solver
 *          named by @c LINEAR_SOLVER in @p config (default @c SparseLU) inside the error based
 *          trust region Newton method (@c MAX_ITERATIONS, @c INIT_DAMPING, @c MIN_DAMPING).
 * @param [in] grid Power grid
 * @param [in] guess Initial guess or @c nullptr for a vector of ones
 * @param [in] tol Error tolerance of the nonlinear solver
 * @param [in] config Solver configuration or @c nullptr for defaults
 * @return Operating point
 * @throws UnsupportedNodeTypeError before solving if a node does not support operating points
 * @throws DimensionError if the guess has the wrong length
 * @throws OperationPointError if the nonlinear solver fails
 */
State findOperationPointSparse(const PowerGrid& grid, std::vector<double> const* guess = nullptr, double tol = defaultOperationPointTolerance,
	IParameterProvider* config = nullptr);

/**
 * @brief Finds an operating point with the options in @p config
 * @details Reads @c TOLERANCE (default @c 1e-9) and @c SPARSE (default @c false) and dispatches
 *          to findOperationPoint() or findOperationPointSparse().
 */
State findOperationPoint(const PowerGrid& grid, IParameterProvider& config, std::vector<double> const* guess = nullptr);

/**
 * @brief Finds an initial condition that satisfies the algebraic constraints
 * @details Solves @f$ (M^+ M) f(u) - f(u) = 0 @f$, which only constrains the algebraic rows
 *          of the vector field. The differential variables are not required to be stationary.
 * @param [in] grid Power grid
 * @param [in] guess Initial guess
 * @param [in] tol Error tolerance of the nonlinear solver
 * @param [in] config Solver configuration or @c nullptr for defaults
 * @return Consistent initial condition
 * @throws DimensionError if the guess has the wrong length
 * @throws OperationPointError if the nonlinear solver fails
 */
std::vector<double> findValidInitialCondition(const PowerGrid& grid, const std::vector<double>& guess, double tol = defaultOperationPointTolerance,
	IParameterProvider* config = nullptr);

} // namespace griddae

#endif  // LIBGRIDDAE_OPERATIONPOINT_HPP_
