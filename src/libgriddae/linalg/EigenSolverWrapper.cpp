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

#include "linalg/EigenSolverWrapper.hpp"
#include "griddae/Exceptions.hpp"

#include <string>

namespace griddae
{

namespace linalg
{

EigenSolverBase* createLinearSolver(const std::string& solverName)
{
	if (solverName.find("SparseLU", 0) == 0)
	{
		if (solverName.find("NaturalOrdering", 0) != std::string::npos)
			return new SparseLU<Eigen::NaturalOrdering<int>>();

		return new SparseLU<Eigen::COLAMDOrdering<int>>();
	}
	else if (solverName.find("SparseQR", 0) == 0)
	{
		if (solverName.find("NaturalOrdering", 0) != std::string::npos)
			return new SparseQR<Eigen::NaturalOrdering<int>>();

		return new SparseQR<Eigen::COLAMDOrdering<int>>();
	}
	else if (solverName.find("BiCGSTAB", 0) == 0)
	{
		if (solverName.find("IncompleteLUT", 0) != std::string::npos)
			return new BiCGSTAB<Eigen::IncompleteLUT<double>>();

		return new BiCGSTAB<Eigen::DiagonalPreconditioner<double>>();
	}

	throw InvalidParameterException("Unknown linear solver name: " + solverName);
}

} // namespace linalg

} // namespace griddae
