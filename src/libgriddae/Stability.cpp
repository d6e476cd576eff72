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

#include "Stability.hpp"
#include "VectorField.hpp"
#include "State.hpp"
#include "Jacobian.hpp"
#include "linalg/DenseMatrix.hpp"
#include "linalg/PseudoInverse.hpp"
#include "griddae/Exceptions.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

namespace griddae
{

std::vector<double> eigenvalueRealParts(const IVectorField& field, const std::vector<double>& u, double t)
{
	const unsigned int n = field.numDofs();
	if (u.size() != n)
		throw DimensionError("State vector has " + std::to_string(u.size()) + " elements, expected " + std::to_string(n));

	linalg::DenseMatrix jac;
	jac.resize(n, n);
	denseJacobian(field, t, u.data(), nullptr, jac);

	const Eigen::Map<const Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>> j(jac.data(), n, n);
	const Eigen::MatrixXd reduced = j * linalg::massProjector(field.massMatrix());

	if (!reduced.allFinite())
		throw StabilityError("Jacobian contains non-finite entries");

	Eigen::EigenSolver<Eigen::MatrixXd> es(reduced, false);
	if (es.info() != Eigen::Success)
		throw StabilityError("Eigenvalue computation did not converge");

	std::vector<double> re(n);
	for (unsigned int i = 0; i < n; ++i)
		re[i] = es.eigenvalues()[i].real();

	std::sort(re.begin(), re.end());
	return re;
}

EigenvalueExtrema checkEigenvalues(const IVectorField& field, const std::vector<double>& u, double t)
{
	const std::vector<double> re = eigenvalueRealParts(field, u, t);

	EigenvalueExtrema ext;
	ext.min = re.empty() ? 0.0 : re.front();
	ext.max = re.empty() ? 0.0 : re.back();
	// TODO: Decide whether a strictly negative maximum should count as stable, too
	ext.stable = std::abs(ext.max) <= stabilityTolerance;

	LOG(Info) << "Jacobian spectrum min " << ext.min << " max " << ext.max << (ext.stable ? " stable" : " unstable");
	return ext;
}

EigenvalueExtrema checkEigenvalues(const IVectorField& field, const State& state, double t)
{
	return checkEigenvalues(field, state.vector(), t);
}

} // namespace griddae
