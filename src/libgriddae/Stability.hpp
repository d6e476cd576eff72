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
 * Spectral analysis of the linearized grid dynamics
 */

#ifndef LIBGRIDDAE_STABILITY_HPP_
#define LIBGRIDDAE_STABILITY_HPP_

#include <vector>

namespace griddae
{

class IVectorField;
class State;

/**
 * @brief Extremal real parts of the Jacobian spectrum
 */
struct EigenvalueExtrema
{
	double min; //!< Smallest real part
	double max; //!< Largest real part
	bool stable; //!< @c true if @c |max| does not exceed the stability tolerance
};

constexpr double stabilityTolerance = 1e-8;

/**
 * @brief Computes the eigenvalues of the Jacobian restricted to the differential variables
 * @details Evaluates the eigenvalues of @f$ J M^+ M @f$, where @f$ J @f$ is the Jacobian of
 *          the field at @p u (default parameters) and @f$ M^+ @f$ the pseudo-inverse of the
 *          mass matrix. The grid is reported stable if the largest real part vanishes
 *          within ::stabilityTolerance. The verdict is logged.
 * @param [in] field Vector field
 * @param [in] u State vector of length IVectorField::numDofs()
 * @param [in] t Time
 * @return Minimum and maximum real part of the spectrum
 */
EigenvalueExtrema checkEigenvalues(const IVectorField& field, const std::vector<double>& u, double t = 0.0);
EigenvalueExtrema checkEigenvalues(const IVectorField& field, const State& state, double t = 0.0);

/**
 * @brief Returns the real parts of the spectrum of @f$ J M^+ M @f$ in ascending order
 */
std::vector<double> eigenvalueRealParts(const IVectorField& field, const std::vector<double>& u, double t = 0.0);

} // namespace griddae

#endif  // LIBGRIDDAE_STABILITY_HPP_
