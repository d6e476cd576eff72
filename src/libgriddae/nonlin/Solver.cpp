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

#include "nonlin/Solver.hpp"
#include "nonlin/AdaptiveTrustRegionNewton.hpp"
#include "nonlin/LevenbergMarquardt.hpp"
#include "nonlin/CompositeSolver.hpp"

namespace griddae
{

namespace nonlin
{

Solver* createSolver(const std::string& name)
{
	if (name == AdaptiveTrustRegionNewtonSolver::identifier())
		return new AdaptiveTrustRegionNewtonSolver();
	if (name == RobustAdaptiveTrustRegionNewtonSolver::identifier())
		return new RobustAdaptiveTrustRegionNewtonSolver();
	if (name == LevenbergMarquardtSolver::identifier())
		return new LevenbergMarquardtSolver();

	// COMPOSITE without SUBSOLVERS and unknown names
	CompositeSolver* cs = new CompositeSolver();
	cs->addSubsolver(new RobustAdaptiveTrustRegionNewtonSolver());
	cs->addSubsolver(new LevenbergMarquardtSolver());
	return cs;
}

} // namespace nonlin

} // namespace griddae
